#ifndef METACLEAN_MIME_DETECTOR_HPP
#define METACLEAN_MIME_DETECTOR_HPP

#include <filesystem>
#include <string>

namespace metaclean {

    /**
     * @brief Content-based file type detection.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file from its leading bytes.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type (e.g., "image/jpeg"), or an empty string when
         * detection is unavailable or failed.
         *
         * @note On Linux/macOS this uses libmagic with the system database.
         * @note On Windows this falls back to the extension table.
         */
        static std::string detect(const std::filesystem::path& path);
    };

} // namespace metaclean
#endif //METACLEAN_MIME_DETECTOR_HPP
