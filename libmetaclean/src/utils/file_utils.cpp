#include <filesystem>
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/errors.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace metaclean {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // _wfopen accepts UTF-16 paths; the \\?\ prefix lifts MAX_PATH
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    bool remove_partial_output(const std::filesystem::path& path, const std::string_view tag) {
        if (path.empty()) return false;

        std::error_code ec;
        const bool removed = std::filesystem::remove(path, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove partial output: " + path.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        if (removed) {
            Logger::log(LogLevel::Debug, "Removed partial output: " + path.string(), tag);
        }
        return removed;
    }

    OutputFileGuard::OutputFileGuard(std::filesystem::path path, const std::string_view tag)
        : path_(std::move(path)), tag_(tag) {}

    OutputFileGuard::~OutputFileGuard() {
        if (created_ && !committed_) {
            remove_partial_output(path_, tag_);
        }
    }

    void OutputFileGuard::throw_create_error(const int err) const {
        if (err == EEXIST) {
            Logger::log(LogLevel::Warning, "Output already exists, leaving it alone: " + path_.string(), tag_);
            throw OutputExistsError("output file already exists: " + path_.string());
        }
        Logger::log(LogLevel::Error, "Cannot create output: " + path_.string() + " (" + std::strerror(err) + ")", tag_);
        throw FilesystemError("cannot create output file " + path_.string() + ": " + std::strerror(err));
    }

    unique_FILE OutputFileGuard::create() {
        errno = 0;
        unique_FILE file(open_file(path_, "wbx"));
        if (!file) {
            throw_create_error(errno != 0 ? errno : EIO);
        }
        created_ = true;
        return file;
    }

#ifndef _WIN32
    int OutputFileGuard::create_fd() {
        const int fd = ::open(path_.c_str(), O_RDWR | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
        if (fd < 0) {
            throw_create_error(errno);
        }
        created_ = true;
        return fd;
    }
#endif

    std::filesystem::path executable_dir() {
        std::error_code ec;
#if defined(_WIN32)
        std::wstring buf(MAX_PATH, L'\0');
        const DWORD len = GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
        if (len > 0 && len < buf.size()) {
            buf.resize(len);
            return std::filesystem::path(buf).parent_path();
        }
#elif defined(__APPLE__)
        uint32_t size = 0;
        _NSGetExecutablePath(nullptr, &size);
        std::string buf(size, '\0');
        if (_NSGetExecutablePath(buf.data(), &size) == 0) {
            auto dir = std::filesystem::weakly_canonical(std::filesystem::path(buf.c_str()).parent_path(), ec);
            if (!ec) return dir;
        }
#else
        const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (!ec) return exe.parent_path();
#endif
        Logger::log(LogLevel::Warning, "Cannot determine executable directory, using working directory", "file_utils");
        auto cwd = std::filesystem::current_path(ec);
        return ec ? std::filesystem::path(".") : cwd;
    }

    bool is_executable_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec) return false;
#ifdef _WIN32
        return true;
#else
        return ::access(path.c_str(), X_OK) == 0;
#endif
    }

} // namespace metaclean
