#include "../../include/bmp_stripper.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

extern "C" {
#include "bmplib.h"
}

namespace {

constexpr auto kTag = "bmp_stripper";

std::string bmplib_result_to_string(const BMPRESULT res) {
    switch (res) {
        case BMP_RESULT_OK:        return "OK";
        case BMP_RESULT_INVALID:   return "invalid pixel data";
        case BMP_RESULT_TRUNCATED: return "file truncated";
        case BMP_RESULT_INSANE:    return "image dimensions too large";
        case BMP_RESULT_PNG:       return "embedded PNG (unsupported)";
        case BMP_RESULT_JPEG:      return "embedded JPEG (unsupported)";
        case BMP_RESULT_ERROR:     return "generic error";
        case BMP_RESULT_ARRAY:     return "OS/2 bitmap array (unsupported)";
        default:                   return "unknown result code (" + std::to_string(res) + ")";
    }
}

// RAII wrapper for a bmplib handle and its FILE
struct ScopedBmp {
    BMPHANDLE h = nullptr;
    FILE* f = nullptr;

    ScopedBmp(const std::filesystem::path& path, const char* mode) {
        f = metaclean::open_file(path, mode);
    }

    explicit ScopedBmp(FILE* file) : f(file) {}

    ~ScopedBmp() {
        if (h) bmp_free(h);
        if (f) std::fclose(f);
    }

    ScopedBmp(const ScopedBmp&) = delete;
    ScopedBmp& operator=(const ScopedBmp&) = delete;
};

// buffers bmplib allocates with malloc
struct FreeDeleter {
    void operator()(unsigned char* p) const { std::free(p); }
};

using malloc_buffer = std::unique_ptr<unsigned char, FreeDeleter>;

std::string describe(const BMPHANDLE h, const BMPRESULT res) {
    std::string err = h ? bmp_errmsg(h) : "";
    if (err.empty()) err = bmplib_result_to_string(res);
    return err;
}

} // namespace

namespace metaclean {

void BmpStripper::strip(const std::filesystem::path& input,
                        const std::filesystem::path& output,
                        const bool preserve_icc) {
    Logger::log(LogLevel::Info, "Stripping BMP: " + input.string(), kTag);

    // --- READ ---
    ScopedBmp in(input, "rb");
    if (!in.f) {
        Logger::log(LogLevel::Error, "Failed to open input BMP: " + input.string(), kTag);
        throw FilesystemError("cannot open BMP input: " + input.string());
    }

    in.h = bmpread_new(in.f);
    if (!in.h) throw ImageProcessingError("bmplib: failed to create read handle");

    BMPRESULT res = bmpread_load_info(in.h);
    if (res != BMP_RESULT_OK) {
        const std::string err = describe(in.h, res);
        Logger::log(LogLevel::Error, "bmplib read error: " + err, kTag);
        throw ImageProcessingError("cannot read BMP header of " + input.filename().string() + ": " + err);
    }

    int width = 0, height = 0, channels = 0, bits = 0;
    bmpread_dimensions(in.h, &width, &height, &channels, &bits, nullptr);
    const bool is_64bit = bmpread_is_64bit(in.h);

    malloc_buffer palette;
    const int num_colors = bmpread_num_palette_colors(in.h);
    if (num_colors > 0) {
        unsigned char* raw_palette = nullptr;
        res = bmpread_load_palette(in.h, &raw_palette);
        palette.reset(raw_palette);
        if (res != BMP_RESULT_OK) {
            throw ImageProcessingError("cannot load BMP palette: " + describe(in.h, res));
        }
        // with a palette loaded, bmplib returns 8-bit indices
        channels = 1;
        bits = 8;
    }

    malloc_buffer icc_profile;
    size_t icc_size = 0;
    if (preserve_icc) {
        icc_size = bmpread_iccprofile_size(in.h);
        if (icc_size > 0) {
            unsigned char* raw_icc = nullptr;
            res = bmpread_load_iccprofile(in.h, &raw_icc);
            icc_profile.reset(raw_icc);
            if (res != BMP_RESULT_OK) {
                Logger::log(LogLevel::Warning, "Failed to load ICC profile, continuing without it", kTag);
                icc_profile.reset();
                icc_size = 0;
            }
        }
    }

    std::vector<unsigned char> pixels(bmpread_buffersize(in.h));
    if (pixels.empty()) {
        throw ImageProcessingError("BMP has no pixel data: " + input.filename().string());
    }
    unsigned char* pixel_ptr = pixels.data();
    res = bmpread_load_image(in.h, &pixel_ptr);
    if (res != BMP_RESULT_OK) {
        const std::string err = describe(in.h, res);
        Logger::log(LogLevel::Error, "Failed to load BMP image data: " + err, kTag);
        throw ImageProcessingError("cannot decode BMP " + input.filename().string() + ": " + err);
    }

    // --- WRITE ---
    OutputFileGuard guard(output, kTag);
    ScopedBmp out(guard.create().release());

    out.h = bmpwrite_new(out.f);
    if (!out.h) throw ImageProcessingError("bmplib: failed to create write handle");

    bmpwrite_set_dimensions(out.h, width, height, channels, bits);
    if (is_64bit) {
        bmpwrite_set_64bit(out.h);
    }
    if (palette) {
        bmpwrite_set_palette(out.h, num_colors, palette.get());
    }
    if (icc_profile && icc_size > 0) {
        bmpwrite_set_iccprofile(out.h, icc_size, icc_profile.get());
        Logger::log(LogLevel::Debug, "Kept ICC profile (" + std::to_string(icc_size) + " bytes)", kTag);
    }
    // resolution is left unset, bmplib then writes 0 dpi

    res = bmpwrite_save_image(out.h, pixels.data());
    if (res != BMP_RESULT_OK) {
        const std::string err = describe(out.h, res);
        Logger::log(LogLevel::Error, "bmplib write error: " + err, kTag);
        throw ImageProcessingError("cannot write BMP " + output.filename().string() + ": " + err);
    }
    if (std::fflush(out.f) != 0 || std::ferror(out.f)) {
        throw FilesystemError("write error on " + output.string());
    }
    guard.commit();

    Logger::log(LogLevel::Info, "BMP stripped: " + output.string(), kTag);
}

} // namespace metaclean
