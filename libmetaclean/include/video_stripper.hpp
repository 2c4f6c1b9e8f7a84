/**
 * @file video_stripper.hpp
 * @brief Removes container metadata from videos by remuxing them with ffmpeg.
 */

#ifndef METACLEAN_VIDEO_STRIPPER_HPP
#define METACLEAN_VIDEO_STRIPPER_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace metaclean {

/**
 * @brief Lifecycle of one VideoStripper invocation.
 */
enum class VideoStripState {
    Idle,
    Invoking,
    Succeeded,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(const VideoStripState s) noexcept {
    switch (s) {
        case VideoStripState::Idle:      return "Idle";
        case VideoStripState::Invoking:  return "Invoking";
        case VideoStripState::Succeeded: return "Succeeded";
        case VideoStripState::Failed:    return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Runs an external ffmpeg binary to copy every audio, video and
 * subtitle stream into a new file without global/stream metadata or
 * chapters.
 *
 * @details Streams are copied, never re-encoded. The executable is never
 * searched for here: the path given at construction is used as is (see
 * locate_ffmpeg()).
 *
 * One instance handles one file at a time. request_stop() may be called
 * from another thread (or a signal handler) while strip() is running.
 */
class VideoStripper {
public:
    /// Default wall clock limit for one ffmpeg run.
    static constexpr std::chrono::seconds kDefaultTimeout{600};

    /**
     * @param ffmpeg Path of the ffmpeg executable.
     * @param timeout Limit for one run, zero for none.
     */
    explicit VideoStripper(std::filesystem::path ffmpeg,
                           std::chrono::seconds timeout = kDefaultTimeout);

    VideoStripper(const VideoStripper&) = delete;
    VideoStripper& operator=(const VideoStripper&) = delete;

    /**
     * @brief Writes a metadata-free remux of @p input to @p output.
     *
     * @throws ToolNotFoundError if the executable is missing or not executable;
     * no output is created in that case.
     * @throws OutputExistsError if @p output already exists; it is left untouched.
     * @throws VideoProcessingError if ffmpeg fails, reports a fatal error,
     * times out or is stopped; any partial output is deleted.
     *
     * A request_stop() issued before this call cancels it without running
     * ffmpeg. The stop request is consumed when strip() returns.
     */
    void strip(const std::filesystem::path& input, const std::filesystem::path& output);

    /**
     * @brief Runs `ffmpeg -version`.
     * @return The first line of its output (e.g. "ffmpeg version 6.1 ...").
     * @throws ToolNotFoundError if the executable is missing or does not
     * identify itself as ffmpeg.
     */
    [[nodiscard]] std::string query_version() const;

    /// Kills the running ffmpeg, or cancels the strip() about to start. Thread-safe.
    void request_stop() noexcept { stop_flag_.store(true); }

    [[nodiscard]] VideoStripState state() const noexcept { return state_.load(); }

    [[nodiscard]] const std::filesystem::path& executable() const noexcept { return ffmpeg_; }

    /**
     * @brief Full ffmpeg command line (program included) for one file.
     */
    [[nodiscard]] std::vector<std::string> build_arguments(const std::filesystem::path& input,
                                                          const std::filesystem::path& output) const;

    /**
     * @brief True if ffmpeg's stderr contains a message that means the
     * output cannot be trusted even when the exit code is 0.
     */
    [[nodiscard]] static bool stderr_indicates_failure(std::string_view stderr_text);

private:
    void ensure_executable() const;

    std::filesystem::path ffmpeg_;
    std::chrono::seconds timeout_;
    std::atomic<bool> stop_flag_{false};
    std::atomic<VideoStripState> state_{VideoStripState::Idle};
};

} // namespace metaclean

#endif // METACLEAN_VIDEO_STRIPPER_HPP
