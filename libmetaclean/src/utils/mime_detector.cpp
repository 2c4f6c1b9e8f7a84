#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/media_type.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <type_traits>

namespace {

#ifndef _WIN32
struct MagicCloser {
    void operator()(const magic_t m) const { if (m) magic_close(m); }
};
using unique_magic = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;
#endif

} // namespace

std::string metaclean::MimeDetector::detect(const std::filesystem::path& path)
{
#ifndef _WIN32
    const unique_magic magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
    if (!magic) {
        Logger::log(LogLevel::Warning, "magic_open failed", "libmagic");
        return {};
    }
    if (magic_load(magic.get(), nullptr) != 0) {
        Logger::log(LogLevel::Warning, std::string("magic_load failed: ") + magic_error(magic.get()), "libmagic");
        return {};
    }
    const char* mime = magic_file(magic.get(), path.string().c_str());
    if (!mime) {
        const char* err = magic_error(magic.get());
        Logger::log(LogLevel::Debug, "magic_file gave no answer for " + path.string() +
                    (err ? std::string(": ") + err : std::string()), "libmagic");
        return {};
    }
    return mime;
#else
    const auto it = ext_to_mime.find(lowercase_extension(path));
    return it != ext_to_mime.end() ? it->second : "application/octet-stream";
#endif
}

metaclean::MediaType metaclean::classify_media(const std::filesystem::path& path)
{
    const std::string mime = MimeDetector::detect(path);
    MediaType type = classify_media(path, mime);
    Logger::log(LogLevel::Debug,
                path.filename().string() + ": mime '" + mime + "' -> " + media_kind_to_string(type.kind),
                "mime_detector");
    return type;
}
