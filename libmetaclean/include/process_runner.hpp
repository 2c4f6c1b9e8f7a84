/**
 * @file process_runner.hpp
 * @brief Runs an external program and collects its exit status and output.
 */

#ifndef METACLEAN_PROCESS_RUNNER_HPP
#define METACLEAN_PROCESS_RUNNER_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace metaclean {

/**
 * @brief Outcome of a child process run by run_process().
 */
struct ProcessResult {
    int exit_code = -1;          ///< exit status, -1 if the child did not exit normally
    int term_signal = 0;         ///< signal that terminated the child, 0 if none
    bool timed_out = false;      ///< killed because the timeout elapsed
    bool cancelled = false;      ///< killed because the stop flag was raised
    bool launch_failed = false;  ///< the program could not be executed at all
    std::string launch_error;    ///< strerror() text when launch_failed
    std::string stdout_output;
    std::string stderr_output;

    /// @return true if the program ran and exited with status 0.
    [[nodiscard]] bool succeeded() const noexcept {
        return !launch_failed && !timed_out && !cancelled && term_signal == 0 && exit_code == 0;
    }
};

/// Captured stdout/stderr are truncated beyond this many bytes each.
inline constexpr std::size_t kMaxCapturedOutput = 1 << 20;

/**
 * @brief Executes @p argv without a shell and waits for it to finish.
 *
 * argv[0] is the program; a name without '/' is looked up in PATH. The
 * child gets /dev/null as stdin and its stdout/stderr are captured.
 * The child is killed with SIGKILL once @p timeout elapses (zero means
 * no limit) or as soon as @p stop_flag becomes true.
 *
 * Only POSIX systems are supported; elsewhere the result reports
 * launch_failed.
 *
 * @param argv Program and arguments; must not be empty.
 * @param timeout Wall clock limit, zero for none.
 * @param stop_flag Optional cancellation flag polled while waiting.
 */
ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
                          const std::atomic<bool>* stop_flag = nullptr);

} // namespace metaclean

#endif // METACLEAN_PROCESS_RUNNER_HPP
