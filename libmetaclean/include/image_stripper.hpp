#ifndef METACLEAN_IMAGE_STRIPPER_HPP
#define METACLEAN_IMAGE_STRIPPER_HPP

#include <filesystem>
#include <span>
#include <string_view>

/**
 * @namespace metaclean
 * @brief Metadata removal for image and video files.
 *
 * @details Contains the Dispatcher (the single entry point used by the
 * CLI), the per-format image strippers and their registry, the ffmpeg
 * based VideoStripper, and the helpers they share (naming, MIME
 * detection, process spawning).
 */
namespace metaclean {

/**
 * @brief Interface for a per-format image metadata stripper.
 *
 * Each implementation handles one image format (or a family of closely
 * related ones) and describes itself through MIME types and extensions
 * so the ImageStripperRegistry can route files to it.
 *
 * Implementations are stateless: strip() may be called repeatedly on the
 * same instance with unrelated files.
 */
class IImageStripper {
public:
    virtual ~IImageStripper() = default;

    // --- self-description ---

    /// @return Human-readable name (e.g. "JpegStripper").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return Supported MIME types (e.g. "image/png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_mime_types() const noexcept = 0;

    /// @return Supported lowercase extensions including the dot (e.g. ".png").
    [[nodiscard]] virtual std::span<const std::string_view>
    get_supported_extensions() const noexcept = 0;

    // --- operation ---

    /**
     * @brief Write a copy of @p input to @p output without metadata.
     *
     * Pixel content is preserved; the container encoding may differ.
     * @p input is never modified.
     *
     * @param input Source image.
     * @param output Destination path; must not exist yet.
     * @param preserve_icc Keep the embedded colour profile (and, where the
     * format ties them together, gamma/chromaticity information).
     * @throws ImageProcessingError if decoding or encoding fails.
     * @throws OutputExistsError if @p output already exists; it is left untouched.
     * @throws FilesystemError if the output cannot be created or written.
     *
     * An output created by this call is removed again when it fails.
     */
    virtual void strip(const std::filesystem::path& input,
                       const std::filesystem::path& output,
                       bool preserve_icc) = 0;
};

} // namespace metaclean

#endif // METACLEAN_IMAGE_STRIPPER_HPP
