/**
 * @file image_stripper_registry.hpp
 * @brief Owns the per-format image strippers and routes files to them.
 */

#ifndef METACLEAN_IMAGE_STRIPPER_REGISTRY_HPP
#define METACLEAN_IMAGE_STRIPPER_REGISTRY_HPP

#include "image_stripper.hpp"
#include <memory>
#include <string>
#include <vector>

namespace metaclean {

/**
 * @brief Registry of every image stripper compiled into the library.
 *
 * @details Which formats are available depends on the image libraries
 * found at build time: JPEG and PNG are always present, WebP, TIFF and
 * BMP only when their libraries were found.
 */
class ImageStripperRegistry {
public:
    /**
     * @brief Instantiates all built-in strippers.
     */
    ImageStripperRegistry();

    /**
     * @brief Find the stripper for a MIME type.
     * @param mime MIME type string (e.g. "image/png").
     * @return Non-owning pointer, or nullptr if none matches.
     */
    [[nodiscard]] IImageStripper* find_by_mime(const std::string& mime) const;

    /**
     * @brief Find the stripper for a file extension (case-insensitive).
     * @param ext Extension including the dot (e.g. ".PNG").
     * @return Non-owning pointer, or nullptr if none matches.
     */
    [[nodiscard]] IImageStripper* find_by_extension(const std::string& ext) const;

    /**
     * @brief Resolve a stripper by MIME type first, then by extension.
     */
    [[nodiscard]] IImageStripper* find(const std::string& mime, const std::string& ext) const;

    /// @return All registered strippers.
    [[nodiscard]] const std::vector<std::unique_ptr<IImageStripper>>& all() const { return strippers_; }

private:
    std::vector<std::unique_ptr<IImageStripper>> strippers_;
};

/**
 * @brief Strip the metadata of any supported image.
 *
 * Convenience wrapper resolving the stripper from the file content and
 * extension. On failure a partially written @p output is removed; a file
 * that already existed at @p output is never touched.
 *
 * @throws UnsupportedFileTypeError if no stripper handles the file.
 * @throws ImageProcessingError if decoding or re-encoding fails.
 * @throws OutputExistsError if @p output already exists.
 */
void strip_image(const std::filesystem::path& input,
                 const std::filesystem::path& output,
                 bool preserve_icc = false);

} // namespace metaclean

#endif // METACLEAN_IMAGE_STRIPPER_REGISTRY_HPP
