#include "../../include/process_runner.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#ifndef _WIN32
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace metaclean {

#ifndef _WIN32

namespace {

constexpr auto kTag = "process_runner";
constexpr int kPollIntervalMs = 50;

// owns a raw file descriptor
struct Fd {
    int fd = -1;

    Fd() = default;
    explicit Fd(const int f) : fd(f) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }

    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

struct Pipe {
    Fd read_end;
    Fd write_end;
};

bool make_pipe(Pipe& p, const bool cloexec) {
    int fds[2];
    if (::pipe(fds) != 0) return false;
    p.read_end.fd = fds[0];
    p.write_end.fd = fds[1];
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    if (cloexec) ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

/**
 * @brief Reads what is available on @p fd into @p sink.
 * @return false once the write end is closed (EOF or error).
 */
bool drain(Fd& fd, std::string& sink) {
    std::array<char, 4096> buf{};
    const ssize_t n = ::read(fd.fd, buf.data(), buf.size());
    if (n > 0) {
        const size_t room = kMaxCapturedOutput > sink.size() ? kMaxCapturedOutput - sink.size() : 0;
        sink.append(buf.data(), std::min(room, static_cast<size_t>(n)));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    fd.reset();
    return false;
}

// only async-signal-safe calls between fork and exec
[[noreturn]] void exec_child(const std::vector<char*>& args, Pipe& out, Pipe& err, Pipe& exec_err) {
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    ::dup2(out.write_end.fd, STDOUT_FILENO);
    ::dup2(err.write_end.fd, STDERR_FILENO);
    ::close(out.read_end.fd);
    ::close(err.read_end.fd);
    ::close(exec_err.read_end.fd);

    ::execvp(args[0], args.data());

    const int code = errno;
    [[maybe_unused]] const ssize_t w = ::write(exec_err.write_end.fd, &code, sizeof(code));
    ::_exit(127);
}

int wait_child(const pid_t pid, int& status) {
    int rc;
    do {
        rc = ::waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    return rc;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::chrono::milliseconds timeout,
                          const std::atomic<bool>* stop_flag) {
    ProcessResult result;
    if (argv.empty()) {
        result.launch_failed = true;
        result.launch_error = "empty command line";
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    Pipe out, err, exec_err;
    if (!make_pipe(out, false) || !make_pipe(err, false) || !make_pipe(exec_err, true)) {
        result.launch_failed = true;
        result.launch_error = std::string("pipe: ") + std::strerror(errno);
        return result;
    }

    Logger::log(LogLevel::Debug, "Spawning " + argv[0] + " with " + std::to_string(argv.size() - 1) + " argument(s)", kTag);

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.launch_failed = true;
        result.launch_error = std::string("fork: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        exec_child(args, out, err, exec_err);
    }

    out.write_end.reset();
    err.write_end.reset();
    exec_err.write_end.reset();

    // the exec pipe closes on a successful exec, or carries errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_err.read_end.fd, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    exec_err.read_end.reset();

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        wait_child(pid, status);
        result.launch_failed = true;
        result.launch_error = std::strerror(exec_errno);
        Logger::log(LogLevel::Debug, "Cannot execute " + argv[0] + ": " + result.launch_error, kTag);
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool killed = false;

    while (out.read_end.fd >= 0 || err.read_end.fd >= 0) {
        if (!killed) {
            if (stop_flag && stop_flag->load()) {
                result.cancelled = true;
            } else if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
            }
            if (result.cancelled || result.timed_out) {
                Logger::log(LogLevel::Warning,
                            std::string("Killing ") + argv[0] + (result.timed_out ? " (timeout)" : " (stop requested)"),
                            kTag);
                ::kill(pid, SIGKILL);
                killed = true;
                // descendants may keep the pipes open, stop reading
                break;
            }
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        Fd* owners[2] = {nullptr, nullptr};
        std::string* sinks[2] = {nullptr, nullptr};
        if (out.read_end.fd >= 0) {
            fds[count] = {out.read_end.fd, POLLIN, 0};
            owners[count] = &out.read_end;
            sinks[count++] = &result.stdout_output;
        }
        if (err.read_end.fd >= 0) {
            fds[count] = {err.read_end.fd, POLLIN, 0};
            owners[count] = &err.read_end;
            sinks[count++] = &result.stderr_output;
        }

        const int ready = ::poll(fds.data(), count, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            Logger::log(LogLevel::Error, std::string("poll failed: ") + std::strerror(errno), kTag);
            ::kill(pid, SIGKILL);
            killed = true;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                drain(*owners[i], *sinks[i]);
            }
        }
    }

    out.read_end.reset();
    err.read_end.reset();

    int status = 0;
    if (wait_child(pid, status) < 0) {
        result.launch_error = std::string("waitpid: ") + std::strerror(errno);
        Logger::log(LogLevel::Error, result.launch_error, kTag);
        return result;
    }
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
    }

    Logger::log(LogLevel::Debug,
                argv[0] + " finished: exit " + std::to_string(result.exit_code) +
                ", signal " + std::to_string(result.term_signal),
                kTag);
    return result;
}

#else

ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds,
                          const std::atomic<bool>*) {
    ProcessResult result;
    result.launch_failed = true;
    result.launch_error = "process spawning is not supported on this platform";
    Logger::log(LogLevel::Error, result.launch_error + (argv.empty() ? "" : ": " + argv[0]), "process_runner");
    return result;
}

#endif

} // namespace metaclean
