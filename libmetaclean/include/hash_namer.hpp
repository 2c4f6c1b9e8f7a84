/**
 * @file hash_namer.hpp
 * @brief Names the cleaned copy of a file: `<hash6>_<original name>`.
 */

#ifndef METACLEAN_HASH_NAMER_HPP
#define METACLEAN_HASH_NAMER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace metaclean {

    /**
     * @brief Derives short, practically unique prefixes for output files.
     *
     * The identifier is 6 lowercase base-36 characters computed from the
     * source path, a nanosecond timestamp and a thread-local random value.
     * It is not a content hash and carries no cryptographic guarantee.
     */
    class HashNamer {
    public:
        static constexpr std::size_t kHashLength = 6;

        /// Attempts before output_path_for() gives up on finding a free name.
        static constexpr int kMaxAttempts = 16;

        /**
         * @brief Computes a fresh identifier for @p source_path.
         *
         * Two calls never intentionally return the same value, even for the
         * same path.
         * @return Exactly kHashLength characters from [0-9a-z].
         */
        [[nodiscard]] std::string name_for(const std::filesystem::path& source_path) const;

        /**
         * @brief Builds the path of the cleaned copy.
         *
         * The file is placed in @p output_dir, or next to the source when
         * @p output_dir is empty. The returned path never equals the source
         * and did not exist at the time of the call.
         *
         * @param source_path File being cleaned.
         * @param output_dir Optional destination directory.
         * @param sanitize Whether to run sanitize_filename() on the original name.
         * @throws FilesystemError if no free name was found in kMaxAttempts tries.
         */
        [[nodiscard]] std::filesystem::path output_path_for(const std::filesystem::path& source_path,
                                                            const std::filesystem::path& output_dir = {},
                                                            bool sanitize = false) const;
    };

    /**
     * @brief Makes a file name safe for every common filesystem.
     *
     * Trims surrounding whitespace, turns inner whitespace runs into '_',
     * removes characters outside [A-Za-z0-9._-] and leading/trailing
     * '.', '_' or '-' from the stem. An empty stem becomes "file". The
     * extension is kept as-is.
     */
    [[nodiscard]] std::string sanitize_filename(std::string_view name);

} // namespace metaclean

#endif // METACLEAN_HASH_NAMER_HPP
