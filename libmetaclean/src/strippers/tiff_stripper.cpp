#include "../../include/tiff_stripper.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <tiffio.h>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace {

constexpr auto kTag = "tiff_stripper";

struct TiffCloser {
    void operator()(TIFF* tif) const { if (tif) TIFFClose(tif); }
};

using unique_TIFF = std::unique_ptr<TIFF, TiffCloser>;

std::string format_tiff_message(const char* module, const char* fmt, va_list ap) {
    char buffer[1024];
    std::vsnprintf(buffer, sizeof(buffer), fmt, ap);
    return module ? std::string(module) + ": " + buffer : std::string(buffer);
}

void tiff_error_handler(const char* module, const char* fmt, va_list ap) {
    Logger::log(LogLevel::Warning, "libtiff: " + format_tiff_message(module, fmt, ap), "libtiff");
}

void tiff_warning_handler(const char* module, const char* fmt, va_list ap) {
    Logger::log(LogLevel::Debug, "libtiff: " + format_tiff_message(module, fmt, ap), "libtiff");
}

// libtiff prints to stderr by default
void install_tiff_handlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        TIFFSetErrorHandler(tiff_error_handler);
        TIFFSetWarningHandler(tiff_warning_handler);
    });
}

template <typename... Args>
void set_field(TIFF* out, const uint32_t tag, Args... args) {
    if (!TIFFSetField(out, tag, args...)) {
        throw metaclean::ImageProcessingError("cannot set TIFF tag " + std::to_string(tag));
    }
}

// copies a scalar tag only when the input sets it explicitly
template <typename T>
void copy_scalar(TIFF* in, TIFF* out, const uint32_t tag) {
    T value{};
    if (TIFFGetField(in, tag, &value)) {
        set_field(out, tag, value);
    }
}

template <typename T>
void copy_scalar_defaulted(TIFF* in, TIFF* out, const uint32_t tag) {
    T value{};
    if (TIFFGetFieldDefaulted(in, tag, &value)) {
        set_field(out, tag, value);
    }
}

// an array tag whose element count is fixed by the tag definition
void copy_float_array(TIFF* in, TIFF* out, const uint32_t tag) {
    float* values = nullptr;
    if (TIFFGetField(in, tag, &values) && values) {
        set_field(out, tag, values);
    }
}

// codecs that register the Predictor tag
bool uses_predictor(const uint16_t compression) {
    switch (compression) {
        case COMPRESSION_LZW:
        case COMPRESSION_ADOBE_DEFLATE:
        case COMPRESSION_DEFLATE:
        case COMPRESSION_LZMA:
        case COMPRESSION_ZSTD:
            return true;
        default:
            return false;
    }
}

// same byte order and classic/BigTIFF flavour as the input, so raw
// uncompressed samples stay valid
std::string output_mode(TIFF* in) {
    std::string mode = "w";
    mode += TIFFIsBigEndian(in) ? 'b' : 'l';
    if (TIFFIsBigTIFF(in)) mode += '8';
    return mode;
}

unique_TIFF open_output(metaclean::OutputFileGuard& guard, const std::string& mode) {
#ifdef _WIN32
    guard.create().reset();
    unique_TIFF out(TIFFOpenW(guard.path().c_str(), mode.c_str()));
#else
    const int fd = guard.create_fd();
    unique_TIFF out(TIFFFdOpen(fd, guard.path().string().c_str(), mode.c_str()));
    if (!out) ::close(fd);
#endif
    if (!out) {
        Logger::log(LogLevel::Error, "Failed to open output TIFF: " + guard.path().string(), kTag);
        throw metaclean::FilesystemError("cannot open TIFF output: " + guard.path().string());
    }
    return out;
}

/**
 * @brief Copies the tags needed to interpret the image data of the current
 * directory, and nothing else.
 *
 * Descriptive tags (Artist, DateTime, Software, ImageDescription, ...),
 * resolution, the EXIF and GPS sub-IFDs, XMP, IPTC and Photoshop blocks are
 * not carried over. The colour profile tags are kept only on request.
 */
void copy_layout_tags(TIFF* in, TIFF* out, const bool preserve_icc) {
    uint16_t compression = COMPRESSION_NONE;
    TIFFGetFieldDefaulted(in, TIFFTAG_COMPRESSION, &compression);
    if (compression == COMPRESSION_OJPEG) {
        // the data depends on JPEGInterchangeFormat offsets that cannot be rewritten
        throw metaclean::ImageProcessingError("old-style JPEG compressed TIFF is not supported");
    }

    uint16_t photometric = 0;
    if (!TIFFGetField(in, TIFFTAG_PHOTOMETRIC, &photometric)) {
        throw metaclean::ImageProcessingError("TIFF page without photometric interpretation");
    }

    copy_scalar<uint32_t>(in, out, TIFFTAG_SUBFILETYPE);
    copy_scalar<uint32_t>(in, out, TIFFTAG_IMAGEWIDTH);
    copy_scalar<uint32_t>(in, out, TIFFTAG_IMAGELENGTH);
    copy_scalar_defaulted<uint16_t>(in, out, TIFFTAG_BITSPERSAMPLE);
    copy_scalar_defaulted<uint16_t>(in, out, TIFFTAG_SAMPLESPERPIXEL);
    copy_scalar_defaulted<uint16_t>(in, out, TIFFTAG_SAMPLEFORMAT);
    copy_scalar_defaulted<uint16_t>(in, out, TIFFTAG_PLANARCONFIG);
    copy_scalar_defaulted<uint16_t>(in, out, TIFFTAG_FILLORDER);
    copy_scalar_defaulted<uint16_t>(in, out, TIFFTAG_ORIENTATION);
    copy_scalar<uint16_t>(in, out, TIFFTAG_MINSAMPLEVALUE);
    copy_scalar<uint16_t>(in, out, TIFFTAG_MAXSAMPLEVALUE);
    set_field(out, TIFFTAG_PHOTOMETRIC, photometric);

    // codec tags are only accepted once the codec is selected
    set_field(out, TIFFTAG_COMPRESSION, compression);
    if (uses_predictor(compression)) {
        copy_scalar<uint16_t>(in, out, TIFFTAG_PREDICTOR);
    }
    if (compression == COMPRESSION_CCITTFAX3) {
        copy_scalar<uint32_t>(in, out, TIFFTAG_GROUP3OPTIONS);
    } else if (compression == COMPRESSION_CCITTFAX4) {
        copy_scalar<uint32_t>(in, out, TIFFTAG_GROUP4OPTIONS);
    } else if (compression == COMPRESSION_JPEG) {
        uint32_t length = 0;
        void* tables = nullptr;
        if (TIFFGetField(in, TIFFTAG_JPEGTABLES, &length, &tables) && tables && length > 0) {
            set_field(out, TIFFTAG_JPEGTABLES, length, tables);
        }
    }

    if (TIFFIsTiled(in)) {
        copy_scalar<uint32_t>(in, out, TIFFTAG_TILEWIDTH);
        copy_scalar<uint32_t>(in, out, TIFFTAG_TILELENGTH);
    } else {
        copy_scalar_defaulted<uint32_t>(in, out, TIFFTAG_ROWSPERSTRIP);
    }

    uint16_t extra_count = 0;
    uint16_t* extra_types = nullptr;
    if (TIFFGetField(in, TIFFTAG_EXTRASAMPLES, &extra_count, &extra_types) && extra_count > 0) {
        set_field(out, TIFFTAG_EXTRASAMPLES, extra_count, extra_types);
    }

    switch (photometric) {
        case PHOTOMETRIC_PALETTE: {
            uint16_t *red = nullptr, *green = nullptr, *blue = nullptr;
            if (!TIFFGetField(in, TIFFTAG_COLORMAP, &red, &green, &blue)) {
                throw metaclean::ImageProcessingError("palette TIFF page without a colour map");
            }
            set_field(out, TIFFTAG_COLORMAP, red, green, blue);
            break;
        }
        case PHOTOMETRIC_YCBCR: {
            uint16_t horizontal = 2, vertical = 2;
            if (TIFFGetFieldDefaulted(in, TIFFTAG_YCBCRSUBSAMPLING, &horizontal, &vertical)) {
                set_field(out, TIFFTAG_YCBCRSUBSAMPLING, horizontal, vertical);
            }
            copy_scalar_defaulted<uint16_t>(in, out, TIFFTAG_YCBCRPOSITIONING);
            copy_float_array(in, out, TIFFTAG_YCBCRCOEFFICIENTS);
            copy_float_array(in, out, TIFFTAG_REFERENCEBLACKWHITE);
            break;
        }
        case PHOTOMETRIC_SEPARATED:
            copy_scalar<uint16_t>(in, out, TIFFTAG_INKSET);
            break;
        default:
            break;
    }

    if (preserve_icc) {
        uint32_t icc_len = 0;
        void* icc_data = nullptr;
        if (TIFFGetField(in, TIFFTAG_ICCPROFILE, &icc_len, &icc_data) && icc_data && icc_len > 0) {
            set_field(out, TIFFTAG_ICCPROFILE, icc_len, icc_data);
            Logger::log(LogLevel::Debug, "Kept ICC profile (" + std::to_string(icc_len) + " bytes)", kTag);
        }
        copy_float_array(in, out, TIFFTAG_WHITEPOINT);
        copy_float_array(in, out, TIFFTAG_PRIMARYCHROMATICITIES);
    }
}

/**
 * @brief Copies every strip or tile of the current directory as stored,
 * without decoding it.
 * @param limit Size of the input file; no chunk can be larger.
 */
void copy_raw_data(TIFF* in, TIFF* out, const uint64_t limit) {
    const bool tiled = TIFFIsTiled(in);
    const uint32_t chunks = tiled ? TIFFNumberOfTiles(in) : TIFFNumberOfStrips(in);

    uint64_t* byte_counts = nullptr;
    if (!TIFFGetField(in, tiled ? TIFFTAG_TILEBYTECOUNTS : TIFFTAG_STRIPBYTECOUNTS, &byte_counts) || !byte_counts) {
        throw metaclean::ImageProcessingError("TIFF page without strip or tile byte counts");
    }

    std::vector<unsigned char> buffer;
    for (uint32_t i = 0; i < chunks; ++i) {
        const uint64_t size = byte_counts[i];
        if (size == 0) continue; // sparse, stays absent in the output
        if (size > limit) {
            throw metaclean::ImageProcessingError("TIFF chunk " + std::to_string(i) + " exceeds the file size");
        }
        buffer.resize(static_cast<size_t>(size));

        const tmsize_t read = tiled
            ? TIFFReadRawTile(in, i, buffer.data(), static_cast<tmsize_t>(size))
            : TIFFReadRawStrip(in, i, buffer.data(), static_cast<tmsize_t>(size));
        if (read < 0) {
            throw metaclean::ImageProcessingError("cannot read TIFF chunk " + std::to_string(i));
        }
        const tmsize_t written = tiled
            ? TIFFWriteRawTile(out, i, buffer.data(), read)
            : TIFFWriteRawStrip(out, i, buffer.data(), read);
        if (written != read) {
            throw metaclean::ImageProcessingError("cannot write TIFF chunk " + std::to_string(i));
        }
    }
}

} // namespace

namespace metaclean {

void TiffStripper::strip(const std::filesystem::path& input,
                         const std::filesystem::path& output,
                         const bool preserve_icc) {
    install_tiff_handlers();
    Logger::log(LogLevel::Info, "Stripping TIFF: " + input.string(), kTag);

    const unique_TIFF in(TIFFOpen(input.string().c_str(), "r"));
    if (!in) {
        Logger::log(LogLevel::Error, "Failed to open input TIFF: " + input.string(), kTag);
        throw ImageProcessingError("cannot open TIFF: " + input.filename().string());
    }
    std::error_code ec;
    const uint64_t input_size = std::filesystem::file_size(input, ec);
    if (ec) {
        throw FilesystemError("cannot stat TIFF input " + input.string() + ": " + ec.message());
    }

    // declared before the handle so the file is closed before any removal
    OutputFileGuard guard(output, kTag);
    unique_TIFF out = open_output(guard, output_mode(in.get()));

    int pages = 0;
    do {
        uint32_t width = 0, height = 0;
        TIFFGetField(in.get(), TIFFTAG_IMAGEWIDTH, &width);
        TIFFGetField(in.get(), TIFFTAG_IMAGELENGTH, &height);
        if (width == 0 || height == 0) {
            Logger::log(LogLevel::Debug, "Skipping empty TIFF directory", kTag);
            continue;
        }

        try {
            copy_layout_tags(in.get(), out.get(), preserve_icc);
            copy_raw_data(in.get(), out.get(), input_size);
        } catch (const ImageProcessingError& e) {
            Logger::log(LogLevel::Error, std::string(e.what()) + " (" + input.string() + ")", kTag);
            throw ImageProcessingError("cannot copy TIFF page " + std::to_string(pages) +
                                       " of " + input.filename().string() + ": " + e.what());
        }

        if (!TIFFWriteDirectory(out.get())) {
            Logger::log(LogLevel::Error, "Failed to write TIFF directory for: " + output.string(), kTag);
            throw ImageProcessingError("cannot write TIFF directory to " + output.filename().string());
        }
        ++pages;
    } while (TIFFReadDirectory(in.get())); // handles multi-page tiffs

    if (pages == 0) {
        throw ImageProcessingError("TIFF has no image page: " + input.filename().string());
    }

    out.reset();
    guard.commit();
    Logger::log(LogLevel::Info, "TIFF stripped (" + std::to_string(pages) + " page(s)): " + output.string(), kTag);
}

} // namespace metaclean
