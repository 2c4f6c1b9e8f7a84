#include "../../include/ffmpeg_locator.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdlib>
#include <sstream>

namespace metaclean {

namespace {
constexpr auto kTag = "ffmpeg_locator";

#ifdef _WIN32
constexpr char kPathSeparator = ';';
#else
constexpr char kPathSeparator = ':';
#endif
}

std::optional<std::filesystem::path> find_in_path(const std::string& name) {
    const char* env = std::getenv("PATH");
    if (!env || !*env) return std::nullopt;

    std::istringstream dirs(env);
    std::string dir;
    while (std::getline(dirs, dir, kPathSeparator)) {
        if (dir.empty()) continue;
        const auto candidate = std::filesystem::path(dir) / name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::filesystem::path locate_ffmpeg(const std::filesystem::path& configured,
                                    const std::filesystem::path& base_dir) {
    if (!configured.empty()) {
        auto resolved = configured.is_absolute() ? configured : base_dir / configured;
        Logger::log(LogLevel::Debug, "Using configured ffmpeg: " + resolved.string(), kTag);
        return resolved;
    }

    const auto bundled_root = base_dir / kFfmpegExecutableName;
    const auto bundled_folder = base_dir / "ffmpeg" / kFfmpegExecutableName;
    for (const auto& candidate : {bundled_root, bundled_folder}) {
        if (is_executable_file(candidate)) {
            Logger::log(LogLevel::Debug, "Found bundled ffmpeg: " + candidate.string(), kTag);
            return candidate;
        }
    }

    if (auto from_path = find_in_path(kFfmpegExecutableName)) {
        Logger::log(LogLevel::Debug, "Found ffmpeg in PATH: " + from_path->string(), kTag);
        return *from_path;
    }

    Logger::log(LogLevel::Warning, "ffmpeg not found next to the executable nor in PATH", kTag);
    return bundled_root;
}

} // namespace metaclean
