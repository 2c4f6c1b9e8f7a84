/**
 * @file tiff_stripper.hpp
 * @brief Defines the IImageStripper implementation for TIFF files.
 */

#ifndef METACLEAN_TIFF_STRIPPER_HPP
#define METACLEAN_TIFF_STRIPPER_HPP

#include "image_stripper.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metaclean {

    /**
     * @brief Implements IImageStripper for TIFF files using libtiff.
     *
     * @details The compressed strips or tiles of every page are copied as
     * stored into a fresh file with the same byte order, together with the
     * tags that describe them: sample layout (bit depth, sample format,
     * extra samples), photometric interpretation, colour map, YCbCr
     * parameters, compression and codec options. Pixel data is never
     * decoded, so depth, colour space and alpha are unchanged.
     *
     * EXIF/GPS sub-IFDs, XMP, IPTC, Photoshop blocks, resolution and the
     * descriptive ASCII tags (Artist, DateTime, Software, ...) are not
     * carried over. Old-style JPEG pages are rejected.
     */
    class TiffStripper final : public IImageStripper {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "TiffStripper";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/tiff" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 2> kExts = { ".tif", ".tiff" };
            return {kExts.data(), kExts.size()};
        }

        // --- operation ---
        void strip(const std::filesystem::path& input,
                   const std::filesystem::path& output,
                   bool preserve_icc) override;
    };

} // namespace metaclean

#endif // METACLEAN_TIFF_STRIPPER_HPP
