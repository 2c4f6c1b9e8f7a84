/**
 * @file dispatcher.hpp
 * @brief Public API of the metaclean library.
 */

#ifndef METACLEAN_DISPATCHER_HPP
#define METACLEAN_DISPATCHER_HPP

#include "operation_result.hpp"
#include <chrono>
#include <filesystem>
#include <memory>

namespace metaclean {

/**
 * @brief Single entry point: classify a file, pick the stripping
 * strategy, name the output and report the outcome.
 *
 * @details Uses PIMPL to keep the image libraries and process handling
 * out of the public header. Each process() call is independent; no state
 * is carried from one file to the next.
 */
class Dispatcher {
public:
    Dispatcher();
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) noexcept;
    Dispatcher& operator=(Dispatcher&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Path of the ffmpeg executable. Relative paths are resolved
     * against the directory of the running executable.
     * Default: empty (search next to the executable, then PATH).
     */
    Dispatcher& ffmpegPath(const std::filesystem::path& path);

    /**
     * @brief Keep embedded colour profiles.
     * Default: false.
     */
    Dispatcher& preserveIccProfile(bool val);

    /**
     * @brief Wall clock limit for one ffmpeg run, zero for none.
     * Default: 600 s.
     */
    Dispatcher& videoTimeout(std::chrono::seconds timeout);

    /**
     * @brief Write cleaned files to @p dir (created on demand).
     * Default: empty (next to the source file).
     */
    Dispatcher& outputDirectory(const std::filesystem::path& dir);

    /**
     * @brief Sanitize the original file name in the output name.
     * Default: false.
     */
    Dispatcher& sanitizeNames(bool val);

    /// @return The ffmpeg executable that videos would be handed to.
    [[nodiscard]] std::filesystem::path resolvedFfmpegPath() const;

    // --- Execution ---

    /**
     * @brief Strips the metadata of one file into a new, renamed copy.
     *
     * Never throws: every failure is reported through the result, and no
     * file is left behind when the result is a failure.
     */
    [[nodiscard]] OperationResult process(const std::filesystem::path& source) noexcept;

    // --- Control ---

    /**
     * @brief Kills the running ffmpeg, if any. Safe to call from a signal handler.
     */
    void stop() noexcept;

private:
    struct Impl;

    // a moved-from Dispatcher starts over with default settings
    Impl& impl();

    std::unique_ptr<Impl> impl_;
};

} // namespace metaclean

#endif // METACLEAN_DISPATCHER_HPP
