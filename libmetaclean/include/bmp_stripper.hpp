/**
 * @file bmp_stripper.hpp
 * @brief Defines the IImageStripper implementation for BMP files using bmplib.
 */

#ifndef METACLEAN_BMP_STRIPPER_HPP
#define METACLEAN_BMP_STRIPPER_HPP

#include "image_stripper.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metaclean {

    /**
     * @brief Implements IImageStripper for Windows/OS2 bitmaps.
     *
     * @details BMP has no EXIF block; the fields that identify a source are
     * the print resolution and an embedded or linked colour profile. The
     * file is rewritten from decoded pixels without either of them.
     */
    class BmpStripper final : public IImageStripper {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "BmpStripper";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 3> kMimes = { "image/bmp", "image/x-ms-bmp", "image/x-bmp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 2> kExts = { ".bmp", ".dib" };
            return {kExts.data(), kExts.size()};
        }

        // --- operation ---
        void strip(const std::filesystem::path& input,
                   const std::filesystem::path& output,
                   bool preserve_icc) override;
    };

} // namespace metaclean

#endif // METACLEAN_BMP_STRIPPER_HPP
