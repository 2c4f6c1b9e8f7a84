/**
 * @file png_stripper.hpp
 * @brief Defines the IImageStripper implementation for PNG files using libpng.
 */

#ifndef METACLEAN_PNG_STRIPPER_HPP
#define METACLEAN_PNG_STRIPPER_HPP

#include "image_stripper.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metaclean {

    /**
     * @brief Implements IImageStripper for PNG files using libpng.
     *
     * @details Rows are read in their native layout (bit depth, colour type
     * and palette unchanged) and written back with only the critical chunks
     * plus tRNS and sBIT. tEXt, zTXt, iTXt, tIME, eXIf, pHYs, sPLT, bKGD and
     * unknown ancillary chunks never reach the output.
     */
    class PngStripper final : public IImageStripper {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "PngStripper";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 2> kMimes = { "image/png", "image/apng" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".png" };
            return {kExts.data(), kExts.size()};
        }

        // --- operation ---

        /**
         * @brief Re-encodes a PNG without its ancillary metadata chunks.
         *
         * Interlaced input is written non-interlaced. With @p preserve_icc
         * the colour management chunks (iCCP, sRGB, gAMA, cHRM) are kept.
         */
        void strip(const std::filesystem::path& input,
                   const std::filesystem::path& output,
                   bool preserve_icc) override;
    };

} // namespace metaclean

#endif // METACLEAN_PNG_STRIPPER_HPP
