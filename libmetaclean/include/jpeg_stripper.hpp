/**
 * @file jpeg_stripper.hpp
 * @brief Defines the IImageStripper implementation for JPEG files.
 */

#ifndef METACLEAN_JPEG_STRIPPER_HPP
#define METACLEAN_JPEG_STRIPPER_HPP

#include "image_stripper.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metaclean {

    /**
     * @brief Implements IImageStripper for JPEG files using libjpeg.
     *
     * @details The image is transcoded at the DCT coefficient level, like
     * `jpegtran -copy none`, so no pixel is re-quantised. Only the markers
     * libjpeg writes itself (JFIF/Adobe headers) end up in the output.
     */
    class JpegStripper final : public IImageStripper {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegStripper";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/jpeg", "image/pjpeg" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 3> kExts = { ".jpg", ".jpeg", ".jpe" };
            return {kExts.data(), kExts.size()};
        }

        // --- operation ---

        /**
         * @brief Losslessly rewrites a JPEG without its APPn and COM markers.
         *
         * EXIF (APP1), XMP (APP1), IPTC/Photoshop (APP13), comments and any
         * other application segment are dropped. Progressive files stay
         * progressive; Huffman tables are re-optimised.
         *
         * @param input Path to the source JPEG file.
         * @param output Path of the cleaned JPEG file.
         * @param preserve_icc If true, APP2 "ICC_PROFILE" segments are kept.
         * @throws ImageProcessingError if libjpeg reports a fatal error.
         */
        void strip(const std::filesystem::path& input,
                   const std::filesystem::path& output,
                   bool preserve_icc) override;
    };

} // namespace metaclean

#endif // METACLEAN_JPEG_STRIPPER_HPP
