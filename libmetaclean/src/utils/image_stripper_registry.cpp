#include "../../include/image_stripper_registry.hpp"
#include "../../include/errors.hpp"
#include "../../include/jpeg_stripper.hpp"
#include "../../include/logger.hpp"
#include "../../include/media_type.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/png_stripper.hpp"
#ifdef METACLEAN_HAVE_WEBP
#include "../../include/webp_stripper.hpp"
#endif
#ifdef METACLEAN_HAVE_TIFF
#include "../../include/tiff_stripper.hpp"
#endif
#ifdef METACLEAN_HAVE_BMP
#include "../../include/bmp_stripper.hpp"
#endif
#include <algorithm>
#include <cctype>

namespace metaclean {

ImageStripperRegistry::ImageStripperRegistry() {
    strippers_.push_back(std::make_unique<JpegStripper>());
    strippers_.push_back(std::make_unique<PngStripper>());
#ifdef METACLEAN_HAVE_WEBP
    strippers_.push_back(std::make_unique<WebpStripper>());
#endif
#ifdef METACLEAN_HAVE_TIFF
    strippers_.push_back(std::make_unique<TiffStripper>());
#endif
#ifdef METACLEAN_HAVE_BMP
    strippers_.push_back(std::make_unique<BmpStripper>());
#endif
}

IImageStripper* ImageStripperRegistry::find_by_mime(const std::string& mime) const {
    for (const auto& stripper : strippers_) {
        for (const auto supported_mime : stripper->get_supported_mime_types()) {
            if (supported_mime == mime) {
                return stripper.get();
            }
        }
    }
    return nullptr;
}

IImageStripper* ImageStripperRegistry::find_by_extension(const std::string& ext) const {
    if (ext.empty() || ext[0] != '.') return nullptr;

    auto iequals = [](const std::string_view s1, const std::string_view s2) {
        return std::equal(s1.begin(), s1.end(), s2.begin(), s2.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    };

    for (const auto& stripper : strippers_) {
        for (const auto supported_ext : stripper->get_supported_extensions()) {
            if (iequals(supported_ext, ext)) {
                return stripper.get();
            }
        }
    }
    return nullptr;
}

IImageStripper* ImageStripperRegistry::find(const std::string& mime, const std::string& ext) const {
    if (IImageStripper* by_mime = find_by_mime(mime)) {
        return by_mime;
    }
    // only trust the extension when content sniffing had nothing to say
    if (!is_inconclusive_mime(mime)) {
        return nullptr;
    }
    return find_by_extension(ext);
}

void strip_image(const std::filesystem::path& input,
                 const std::filesystem::path& output,
                 const bool preserve_icc) {
    static const ImageStripperRegistry registry;

    const std::string mime = MimeDetector::detect(input);
    IImageStripper* stripper = registry.find(mime, input.extension().string());
    if (!stripper) {
        throw UnsupportedFileTypeError("unsupported file type: " + (mime.empty() ? input.extension().string() : mime));
    }

    // each stripper creates the output exclusively and removes only what it created
    Logger::log(LogLevel::Debug, "Using " + std::string(stripper->get_name()) + " for " + input.string(), "image_stripper");
    stripper->strip(input, output, preserve_icc);
}

} // namespace metaclean
