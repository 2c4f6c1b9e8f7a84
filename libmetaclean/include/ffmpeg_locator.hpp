/**
 * @file ffmpeg_locator.hpp
 * @brief Resolves which ffmpeg executable the VideoStripper runs.
 */

#ifndef METACLEAN_FFMPEG_LOCATOR_HPP
#define METACLEAN_FFMPEG_LOCATOR_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace metaclean {

/// Platform file name of the transcoder.
#ifdef _WIN32
inline constexpr auto kFfmpegExecutableName = "ffmpeg.exe";
#else
inline constexpr auto kFfmpegExecutableName = "ffmpeg";
#endif

/**
 * @brief Looks @p name up in the directories of the PATH environment variable.
 * @return The first executable match, or std::nullopt.
 */
std::optional<std::filesystem::path> find_in_path(const std::string& name);

/**
 * @brief Picks the ffmpeg binary to use.
 *
 * A non-empty @p configured path wins: relative paths are taken relative
 * to @p base_dir and the result is returned whether it exists or not.
 * Otherwise the bundled locations are tried in order:
 * `<base_dir>/ffmpeg`, `<base_dir>/ffmpeg/ffmpeg`, then PATH.
 * When nothing is found the first bundled location is returned so the
 * caller can report which file was expected.
 *
 * @param configured User supplied path, may be empty.
 * @param base_dir Directory the application ships in (usually executable_dir()).
 */
std::filesystem::path locate_ffmpeg(const std::filesystem::path& configured,
                                    const std::filesystem::path& base_dir);

} // namespace metaclean

#endif // METACLEAN_FFMPEG_LOCATOR_HPP
