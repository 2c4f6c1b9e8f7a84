#include "../../include/hash_namer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <chrono>
#include <functional>
#include <regex>
#include <system_error>

namespace fs = std::filesystem;

namespace metaclean {

std::string HashNamer::name_for(const fs::path& source_path) const {
    const auto now = static_cast<std::uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const std::uint64_t path_hash = std::hash<std::string>{}(source_path.string());

    std::uint64_t seed = RandomUtils::mix64(path_hash);
    seed = RandomUtils::mix64(seed ^ now);
    seed = RandomUtils::mix64(seed ^ RandomUtils::next_u64());
    return RandomUtils::to_base36(seed, kHashLength);
}

fs::path HashNamer::output_path_for(const fs::path& source_path,
                                    const fs::path& output_dir,
                                    const bool sanitize) const {
    const fs::path dir = output_dir.empty() ? source_path.parent_path() : output_dir;
    const std::string original = source_path.filename().string();
    const std::string base = sanitize ? sanitize_filename(original) : original;

    std::error_code ec;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        fs::path candidate = dir / (name_for(source_path) + "_" + base);
        if (candidate == source_path) continue;
        if (!fs::exists(candidate, ec) && !ec) {
            return candidate;
        }
        Logger::log(LogLevel::Debug, "Output name taken, re-rolling: " + candidate.string(), "hash_namer");
    }

    throw FilesystemError("could not find a free output name in " + dir.string());
}

std::string sanitize_filename(const std::string_view name) {
    static const std::regex kWhitespace(R"(\s+)");
    static const std::regex kUnsafe(R"([^A-Za-z0-9._-])");

    std::string trimmed(name);
    const auto first = trimmed.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        trimmed.clear();
    } else {
        trimmed = trimmed.substr(first, trimmed.find_last_not_of(" \t\r\n\f\v") - first + 1);
    }

    const fs::path as_path(trimmed);
    std::string stem = as_path.stem().string();
    const std::string ext = as_path.extension().string();

    stem = std::regex_replace(stem, kWhitespace, "_");
    stem = std::regex_replace(stem, kUnsafe, "");

    const auto keep_from = stem.find_first_not_of("._-");
    if (keep_from == std::string::npos) {
        stem.clear();
    } else {
        stem = stem.substr(keep_from, stem.find_last_not_of("._-") - keep_from + 1);
    }

    if (stem.empty()) stem = "file";
    return stem + ext;
}

} // namespace metaclean
