/**
 * @file operation_result.hpp
 * @brief Value types exchanged between the Dispatcher and its caller.
 */

#ifndef METACLEAN_OPERATION_RESULT_HPP
#define METACLEAN_OPERATION_RESULT_HPP

#include "errors.hpp"
#include "media_type.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace metaclean {

    /**
     * @brief The file selected by the user, as seen at the start of an operation.
     */
    struct SourceFile {
        std::filesystem::path path; ///< Absolute path
        MediaKind kind = MediaKind::Unsupported;
        std::string mime;           ///< Detected MIME type (may be empty)
        std::uintmax_t size = 0;    ///< Size in bytes
    };

    enum class OperationStatus {
        Success,
        Failure
    };

    /**
     * @brief Outcome of one Dispatcher::process() call.
     *
     * On success output_path is set; on failure error_kind and
     * error_message are set. Never persisted.
     */
    struct OperationResult {
        OperationStatus status = OperationStatus::Failure;
        std::optional<std::filesystem::path> output_path;
        std::optional<std::string> error_message;
        std::optional<ErrorKind> error_kind;

        [[nodiscard]] bool ok() const noexcept { return status == OperationStatus::Success; }

        static OperationResult success(std::filesystem::path output) {
            OperationResult r;
            r.status = OperationStatus::Success;
            r.output_path = std::move(output);
            return r;
        }

        static OperationResult failure(const ErrorKind kind, std::string message) {
            OperationResult r;
            r.status = OperationStatus::Failure;
            r.error_kind = kind;
            r.error_message = std::move(message);
            return r;
        }
    };

} // namespace metaclean

#endif // METACLEAN_OPERATION_RESULT_HPP
