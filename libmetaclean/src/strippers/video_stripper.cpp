#include "../../include/video_stripper.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"
#include <array>
#include <system_error>
#include <utility>

namespace metaclean {

namespace {

constexpr auto kTag = "video_stripper";

// ffmpeg messages after which the output is unusable
constexpr std::array<std::string_view, 6> kFatalStderrPatterns = {
    "Conversion failed",
    "Invalid data found when processing input",
    "Error opening input",
    "Error opening output",
    "Could not write header",
    "Error while",
};

std::string first_line(const std::string& text) {
    const auto end = text.find_first_of("\r\n");
    return text.substr(0, end);
}

// last non-empty line of ffmpeg's stderr, for error messages
std::string last_line(const std::string& text) {
    const auto end = text.find_last_not_of("\r\n");
    if (end == std::string::npos) return {};
    const auto sep = text.find_last_of("\r\n", end);
    const auto start = sep == std::string::npos ? 0 : sep + 1;
    return text.substr(start, end - start + 1);
}

} // namespace

VideoStripper::VideoStripper(std::filesystem::path ffmpeg, const std::chrono::seconds timeout)
    : ffmpeg_(std::move(ffmpeg)), timeout_(timeout) {}

void VideoStripper::ensure_executable() const {
    if (ffmpeg_.empty() || !is_executable_file(ffmpeg_)) {
        Logger::log(LogLevel::Error, "ffmpeg not found at " + ffmpeg_.string(), kTag);
        throw ToolNotFoundError("ffmpeg not found or not executable: " + ffmpeg_.string());
    }
}

std::vector<std::string> VideoStripper::build_arguments(const std::filesystem::path& input,
                                                        const std::filesystem::path& output) const {
    return {
        ffmpeg_.string(),
        "-nostdin", "-hide_banner",
        "-loglevel", "error",
        "-y",
        "-i", input.string(),
        "-map", "0:v?", "-map", "0:a?", "-map", "0:s?",
        "-map_metadata", "-1",
        "-map_chapters", "-1",
        "-fflags", "+bitexact",
        "-c", "copy",
        output.string(),
    };
}

bool VideoStripper::stderr_indicates_failure(const std::string_view stderr_text) {
    for (const auto pattern : kFatalStderrPatterns) {
        if (stderr_text.find(pattern) != std::string_view::npos) return true;
    }
    return false;
}

void VideoStripper::strip(const std::filesystem::path& input, const std::filesystem::path& output) {
    // a stop requested before this call still cancels it; the flag is cleared on return
    struct StopFlagReset {
        std::atomic<bool>& flag;
        ~StopFlagReset() { flag.store(false); }
    };
    const StopFlagReset stop_reset{stop_flag_};

    state_.store(VideoStripState::Idle);

    auto fail = [&](auto error) {
        state_.store(VideoStripState::Failed);
        Logger::log(LogLevel::Error, error.what(), kTag);
        throw error;
    };

    try {
        ensure_executable();
    } catch (const ToolNotFoundError&) {
        state_.store(VideoStripState::Failed);
        throw;
    }

    // reserve the name; ffmpeg then overwrites the empty file this call owns
    OutputFileGuard guard(output, kTag);
    try {
        guard.create().reset();
    } catch (const FilesystemError&) {
        state_.store(VideoStripState::Failed);
        throw;
    }

    if (stop_flag_.load()) {
        fail(VideoProcessingError("stopped before ffmpeg was started"));
    }

    Logger::log(LogLevel::Info, "Stripping video: " + input.string(), kTag);
    state_.store(VideoStripState::Invoking);

    const ProcessResult run = run_process(build_arguments(input, output),
                                          std::chrono::duration_cast<std::chrono::milliseconds>(timeout_),
                                          &stop_flag_);

    if (run.launch_failed) {
        fail(ToolNotFoundError("cannot execute " + ffmpeg_.string() + ": " + run.launch_error));
    }
    if (run.cancelled) {
        fail(VideoProcessingError("ffmpeg was stopped before finishing"));
    }
    if (run.timed_out) {
        fail(VideoProcessingError("ffmpeg timed out after " + std::to_string(timeout_.count()) + " s"));
    }
    if (run.term_signal != 0) {
        fail(VideoProcessingError("ffmpeg killed by signal " + std::to_string(run.term_signal)));
    }
    if (run.exit_code != 0) {
        const std::string detail = last_line(run.stderr_output);
        fail(VideoProcessingError("ffmpeg exited with code " + std::to_string(run.exit_code) +
                                  (detail.empty() ? "" : ": " + detail)));
    }
    if (stderr_indicates_failure(run.stderr_output)) {
        fail(VideoProcessingError("ffmpeg reported an error: " + last_line(run.stderr_output)));
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(output, ec);
    if (ec || size == 0) {
        fail(VideoProcessingError("ffmpeg produced no output: " + output.string()));
    }

    if (!run.stderr_output.empty()) {
        Logger::log(LogLevel::Debug, "ffmpeg stderr: " + run.stderr_output, kTag);
    }

    guard.commit();
    state_.store(VideoStripState::Succeeded);
    Logger::log(LogLevel::Info, "Video stripped: " + output.string(), kTag);
}

std::string VideoStripper::query_version() const {
    ensure_executable();

    const ProcessResult run = run_process({ffmpeg_.string(), "-version"}, std::chrono::seconds(10));
    if (run.launch_failed) {
        throw ToolNotFoundError("cannot execute " + ffmpeg_.string() + ": " + run.launch_error);
    }

    const std::string& text = run.stdout_output.empty() ? run.stderr_output : run.stdout_output;
    if (!run.succeeded() || text.find("ffmpeg version") == std::string::npos) {
        throw ToolNotFoundError(ffmpeg_.string() + " does not look like ffmpeg");
    }
    return first_line(text);
}

} // namespace metaclean
