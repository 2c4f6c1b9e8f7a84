/**
 * @file webp_stripper.hpp
 * @brief Defines the IImageStripper implementation for WebP files.
 */

#ifndef METACLEAN_WEBP_STRIPPER_HPP
#define METACLEAN_WEBP_STRIPPER_HPP

#include "image_stripper.hpp"
#include <array>
#include <span>
#include <string_view>

namespace metaclean {

    /**
     * @brief Implements IImageStripper for WebP files using libwebpmux.
     *
     * @details The RIFF container is rebuilt without the EXIF and XMP
     * chunks. Image data (VP8, VP8L, ALPH, ANIM/ANMF frames) is carried
     * over byte for byte, so lossy files are not re-encoded.
     */
    class WebpStripper final : public IImageStripper {
    public:
        // --- self-description ---
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "WebpStripper";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_mime_types() const noexcept override {
            static constexpr std::array<std::string_view, 1> kMimes = { "image/webp" };
            return {kMimes.data(), kMimes.size()};
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_extensions() const noexcept override {
            static constexpr std::array<std::string_view, 1> kExts = { ".webp" };
            return {kExts.data(), kExts.size()};
        }

        // --- operation ---
        void strip(const std::filesystem::path& input,
                   const std::filesystem::path& output,
                   bool preserve_icc) override;
    };

} // namespace metaclean

#endif // METACLEAN_WEBP_STRIPPER_HPP
