/**
 * @file media_type.hpp
 * @brief Media kinds handled by metaclean and the extension/MIME tables
 * used to classify an input file.
 */

#ifndef METACLEAN_MEDIA_TYPE_HPP
#define METACLEAN_MEDIA_TYPE_HPP

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace metaclean {

/**
 * @brief Which stripping branch a file belongs to.
 */
enum class MediaKind {
    Image,
    Video,
    Unsupported
};

/**
 * @brief Result of classifying an input file.
 */
struct MediaType {
    MediaKind kind = MediaKind::Unsupported;
    std::string mime; ///< MIME type from content sniffing or the extension table
};

inline std::string media_kind_to_string(const MediaKind kind) {
    switch (kind) {
        case MediaKind::Image:       return "image";
        case MediaKind::Video:       return "video";
        case MediaKind::Unsupported: return "unsupported";
    }
    return "unsupported";
}

///< Lowercase extension -> MIME type for every format accepted by the file picker.
inline const std::unordered_map<std::string, std::string> ext_to_mime = {
    // images
    {".jpg",  "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".jpe",  "image/jpeg"},
    {".png",  "image/png"},
    {".webp", "image/webp"},
    {".bmp",  "image/bmp"},
    {".tif",  "image/tiff"},
    {".tiff", "image/tiff"},

    // video containers
    {".mp4",  "video/mp4"},
    {".m4v",  "video/x-m4v"},
    {".mov",  "video/quicktime"},
    {".mkv",  "video/x-matroska"},
    {".webm", "video/webm"},
    {".avi",  "video/x-msvideo"}
};

/**
 * @brief True when libmagic's answer says nothing about the media type.
 *
 * In that case the extension decides, mirroring how the file picker
 * behaves when content sniffing is inconclusive.
 */
inline bool is_inconclusive_mime(const std::string_view mime) {
    return mime.empty()
        || mime == "application/octet-stream"
        || mime == "text/plain"
        || mime == "inode/x-empty";
}

/// @return Lowercased extension of @p path, including the dot.
inline std::string lowercase_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
        [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

/**
 * @brief Maps a MIME type onto a media kind by its top-level type.
 */
inline MediaKind kind_from_mime(const std::string_view mime) {
    if (mime.starts_with("image/")) return MediaKind::Image;
    if (mime.starts_with("video/")) return MediaKind::Video;
    return MediaKind::Unsupported;
}

/**
 * @brief Classifies a file from an already-detected MIME type and its extension.
 *
 * @param path File path (only its extension is used).
 * @param detected_mime MIME type from content sniffing, possibly empty.
 */
inline MediaType classify_media(const std::filesystem::path& path, const std::string& detected_mime) {
    if (!is_inconclusive_mime(detected_mime)) {
        return {kind_from_mime(detected_mime), detected_mime};
    }

    const auto it = ext_to_mime.find(lowercase_extension(path));
    if (it == ext_to_mime.end()) {
        return {MediaKind::Unsupported, detected_mime};
    }
    return {kind_from_mime(it->second), it->second};
}

/**
 * @brief Classifies a file by sniffing its content with libmagic, falling
 * back to the extension table.
 */
MediaType classify_media(const std::filesystem::path& path);

} // namespace metaclean

#endif // METACLEAN_MEDIA_TYPE_HPP
