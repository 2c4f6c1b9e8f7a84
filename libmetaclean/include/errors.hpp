/**
 * @file errors.hpp
 * @brief Typed exceptions thrown by the stripping pipeline.
 *
 * Every failure inside libmetaclean is reported by throwing one of these
 * types. The Dispatcher is the only place that catches them; it turns the
 * exception into an OperationResult carrying the same ErrorKind.
 */

#ifndef METACLEAN_ERRORS_HPP
#define METACLEAN_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace metaclean {

    /**
     * @brief Failure categories surfaced to the presentation layer.
     */
    enum class ErrorKind {
        UnsupportedFileType,  ///< Neither a supported image nor a video
        ImageProcessingError, ///< Image could not be decoded or re-encoded
        ToolNotFoundError,    ///< ffmpeg missing at its configured path
        VideoProcessingError, ///< ffmpeg failed, timed out or was cancelled
        FilesystemError       ///< Permissions, missing input, disk full...
    };

    /// @return Stable name of the kind, as printed by the CLI.
    [[nodiscard]] constexpr std::string_view to_string(const ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::UnsupportedFileType:  return "UnsupportedFileType";
            case ErrorKind::ImageProcessingError: return "ImageProcessingError";
            case ErrorKind::ToolNotFoundError:    return "ToolNotFoundError";
            case ErrorKind::VideoProcessingError: return "VideoProcessingError";
            case ErrorKind::FilesystemError:      return "FilesystemError";
        }
        return "Unknown";
    }

    /**
     * @brief Base class of all metaclean exceptions.
     */
    class MetaCleanError : public std::runtime_error {
    public:
        MetaCleanError(const ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    class UnsupportedFileTypeError final : public MetaCleanError {
    public:
        explicit UnsupportedFileTypeError(const std::string& message)
            : MetaCleanError(ErrorKind::UnsupportedFileType, message) {}
    };

    class ImageProcessingError final : public MetaCleanError {
    public:
        explicit ImageProcessingError(const std::string& message)
            : MetaCleanError(ErrorKind::ImageProcessingError, message) {}
    };

    /**
     * @brief The transcoding executable does not exist or is not executable.
     *
     * Kept distinct from VideoProcessingError because the user can fix it
     * (the binary is not bundled by default).
     */
    class ToolNotFoundError final : public MetaCleanError {
    public:
        explicit ToolNotFoundError(const std::string& message)
            : MetaCleanError(ErrorKind::ToolNotFoundError, message) {}
    };

    class VideoProcessingError final : public MetaCleanError {
    public:
        explicit VideoProcessingError(const std::string& message)
            : MetaCleanError(ErrorKind::VideoProcessingError, message) {}
    };

    class FilesystemError : public MetaCleanError {
    public:
        explicit FilesystemError(const std::string& message)
            : MetaCleanError(ErrorKind::FilesystemError, message) {}
    };

    /**
     * @brief The output name was already taken when the file was created.
     *
     * Nothing was written, so there is nothing to clean up; the Dispatcher
     * retries with a fresh name.
     */
    class OutputExistsError final : public FilesystemError {
    public:
        explicit OutputExistsError(const std::string& message)
            : FilesystemError(message) {}
    };

} // namespace metaclean

#endif // METACLEAN_ERRORS_HPP
