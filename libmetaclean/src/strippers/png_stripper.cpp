#include "../../include/png_stripper.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <zlib.h>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr auto kTag = "png_stripper";

/**
 * @brief libpng error handler that throws a C++ exception.
 * @param msg The error message from libpng.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    throw std::runtime_error(msg);
}

/**
 * @brief libpng warning handler.
 * @param msg The warning message from libpng.
 */
void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Debug, std::string("libpng: ") + msg, "libpng");
}

/**
 * @brief RAII wrapper for libpng read structs (png_structp, png_infop).
 */
struct PngRead {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngRead() = default;
    PngRead(const PngRead&) = delete;
    PngRead& operator=(const PngRead&) = delete;

    ~PngRead() {
        if (png || info) png_destroy_read_struct(&png, &info, nullptr);
    }
};

/**
 * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngWrite() = default;
    PngWrite(const PngWrite&) = delete;
    PngWrite& operator=(const PngWrite&) = delete;

    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
};

/**
 * @brief Copies the chunks needed to reproduce the pixels: PLTE, tRNS, sBIT.
 */
void copy_pixel_chunks(png_structp in_png, png_infop in_info,
                       png_structp out_png, png_infop out_info) {
    // plte
    if (png_get_valid(in_png, in_info, PNG_INFO_PLTE)) {
        png_colorp palette = nullptr;
        int num_palette = 0;
        if (png_get_PLTE(in_png, in_info, &palette, &num_palette)) {
            png_set_PLTE(out_png, out_info, palette, num_palette);
        }
    }
    // trns
    if (png_get_valid(in_png, in_info, PNG_INFO_tRNS)) {
        png_bytep trans_alpha = nullptr;
        int num_trans = 0;
        png_color_16p trans_color = nullptr;
        if (png_get_tRNS(in_png, in_info, &trans_alpha, &num_trans, &trans_color)) {
            png_set_tRNS(out_png, out_info, trans_alpha, num_trans, trans_color);
        }
    }
    // sbit
    if (png_get_valid(in_png, in_info, PNG_INFO_sBIT)) {
        png_color_8p sig_bit = nullptr;
        if (png_get_sBIT(in_png, in_info, &sig_bit)) {
            png_set_sBIT(out_png, out_info, sig_bit);
        }
    }
}

/**
 * @brief Copies colour management chunks: iCCP, sRGB, gAMA, cHRM.
 */
void copy_color_chunks(png_structp in_png, png_infop in_info,
                       png_structp out_png, png_infop out_info) {
    // iccp
    if (png_get_valid(in_png, in_info, PNG_INFO_iCCP)) {
        png_charp name = nullptr;
        int comp_type = 0;
        png_bytep profile = nullptr;
        png_uint_32 profile_len = 0;
        if (png_get_iCCP(in_png, in_info, &name, &comp_type, &profile, &profile_len)) {
            png_set_iCCP(out_png, out_info, name, comp_type, profile, profile_len);
        }
    }
    // srgb
    if (png_get_valid(in_png, in_info, PNG_INFO_sRGB)) {
        int intent = 0;
        if (png_get_sRGB(in_png, in_info, &intent)) {
            png_set_sRGB(out_png, out_info, intent);
        }
    }
    // gama
    if (png_get_valid(in_png, in_info, PNG_INFO_gAMA)) {
        png_fixed_point gamma = 0;
        if (png_get_gAMA_fixed(in_png, in_info, &gamma)) {
            png_set_gAMA_fixed(out_png, out_info, gamma);
        }
    }
    // chrm
    if (png_get_valid(in_png, in_info, PNG_INFO_cHRM)) {
        png_fixed_point wx, wy, rx, ry, gx, gy, bx, by;
        if (png_get_cHRM_fixed(in_png, in_info, &wx, &wy, &rx, &ry, &gx, &gy, &bx, &by)) {
            png_set_cHRM_fixed(out_png, out_info, wx, wy, rx, ry, gx, gy, bx, by);
        }
    }
}

void strip_png(const std::filesystem::path& input,
               const std::filesystem::path& output,
               const bool preserve_icc) {
    const metaclean::unique_FILE fp_in(metaclean::open_file(input, "rb"));
    if (!fp_in) {
        Logger::log(LogLevel::Error, "Cannot open PNG input: " + input.string(), kTag);
        throw metaclean::FilesystemError("cannot open PNG input: " + input.string());
    }

    // --- READ ---

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw std::runtime_error("png_create_info_struct failed");

    // only the chunks copied below are ever needed
    png_set_keep_unknown_chunks(rd.png, PNG_HANDLE_CHUNK_NEVER, nullptr, 0);

    png_init_io(rd.png, fp_in.get());
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0, interlace = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, &interlace, nullptr, nullptr);

    Logger::log(LogLevel::Debug,
                "PNG " + std::to_string(width) + "x" + std::to_string(height) +
                ", depth " + std::to_string(bit_depth) + ", type " + std::to_string(color_type) +
                (interlace == PNG_INTERLACE_ADAM7 ? ", interlaced" : ""),
                kTag);

    // deinterlace into full rows; no other transform, samples stay native
    png_set_interlace_handling(rd.png);
    png_read_update_info(rd.png, rd.info);

    const size_t rowbytes = png_get_rowbytes(rd.png, rd.info);
    std::vector<unsigned char> image(rowbytes * height);
    std::vector<png_bytep> row_pointers(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        row_pointers[y] = image.data() + y * rowbytes;
    }
    png_read_image(rd.png, row_pointers.data());
    png_read_end(rd.png, nullptr);

    // --- WRITE ---

    // declared before the stream so the file is closed before any removal
    metaclean::OutputFileGuard guard(output, kTag);
    const metaclean::unique_FILE fp_out = guard.create();

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw std::runtime_error("png_create_info_struct failed");

    png_init_io(wr.png, fp_out.get());

    png_set_compression_level(wr.png, Z_BEST_COMPRESSION);
    png_set_compression_mem_level(wr.png, 9);
    png_set_compression_strategy(wr.png, Z_DEFAULT_STRATEGY);
    png_set_filter(wr.png, PNG_FILTER_TYPE_BASE, PNG_ALL_FILTERS);

    png_set_IHDR(wr.png, wr.info, width, height, bit_depth, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

    // must be done *before* png_write_info
    copy_pixel_chunks(rd.png, rd.info, wr.png, wr.info);
    if (preserve_icc) {
        copy_color_chunks(rd.png, rd.info, wr.png, wr.info);
    }

    png_write_info(wr.png, wr.info);
    png_write_image(wr.png, row_pointers.data());
    png_write_end(wr.png, nullptr);

    if (std::fflush(fp_out.get()) != 0 || std::ferror(fp_out.get())) {
        throw metaclean::FilesystemError("write error on " + output.string());
    }
    guard.commit();
}

} // namespace

namespace metaclean {

void PngStripper::strip(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        const bool preserve_icc) {
    Logger::log(LogLevel::Info, "Stripping PNG: " + input.string(), kTag);
    try {
        strip_png(input, output, preserve_icc);
    } catch (const MetaCleanError&) {
        throw;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "PNG stripping failed: " + std::string(e.what()), kTag);
        throw ImageProcessingError("cannot process PNG " + input.filename().string() + ": " + e.what());
    }
    Logger::log(LogLevel::Info, "PNG stripped: " + output.string(), kTag);
}

} // namespace metaclean
