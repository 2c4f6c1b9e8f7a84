#include "../../include/jpeg_stripper.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <jpeglib.h>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr auto kTag = "jpeg_stripper";

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Routes libjpeg warnings (corrupt data the decoder recovered from) to the logger.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX]{};
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

constexpr int kIccMarker = JPEG_APP0 + 2;
constexpr char kIccSignature[] = "ICC_PROFILE"; // followed by a NUL byte

bool is_icc_marker(const jpeg_saved_marker_ptr m) {
    return m->marker == kIccMarker &&
           m->data_length >= sizeof(kIccSignature) &&
           std::memcmp(m->data, kIccSignature, sizeof(kIccSignature)) == 0;
}

/**
 * @brief Copies ICC profile segments, in their original order, to the output.
 * @return Number of segments written.
 */
int copy_icc_markers(const j_decompress_ptr srcinfo, const j_compress_ptr dstinfo) {
    int written = 0;
    for (jpeg_saved_marker_ptr m = srcinfo->marker_list; m; m = m->next) {
        if (is_icc_marker(m)) {
            jpeg_write_marker(dstinfo, m->marker, m->data, m->data_length);
            ++written;
        }
    }
    return written;
}

} // namespace

namespace metaclean {

void JpegStripper::strip(const std::filesystem::path& input,
                         const std::filesystem::path& output,
                         const bool preserve_icc) {
    Logger::log(LogLevel::Info, "Stripping JPEG: " + input.string(), kTag);

    unique_FILE infile(open_file(input, "rb"));
    if (!infile) {
        Logger::log(LogLevel::Error, "Cannot open JPEG input: " + input.string(), kTag);
        throw FilesystemError("cannot open JPEG input: " + input.string());
    }
    OutputFileGuard guard(output, kTag);
    unique_FILE outfile = guard.create();

    jpeg_decompress_struct srcinfo{};
    jpeg_compress_struct dstinfo{};
    JpegErrorMgr jsrcerr{}, jdsterr{};

    // error handlers must be set before any possible error
    srcinfo.err = jpeg_std_error(&jsrcerr.pub);
    jsrcerr.pub.error_exit = jpeg_error_exit_throw;
    jsrcerr.pub.output_message = jpeg_output_message_log;

    dstinfo.err = jpeg_std_error(&jdsterr.pub);
    jdsterr.pub.error_exit = jpeg_error_exit_throw;
    jdsterr.pub.output_message = jpeg_output_message_log;

    try {
        jpeg_create_decompress(&srcinfo);
        jpeg_create_compress(&dstinfo);

        jpeg_stdio_src(&srcinfo, infile.get());
        // markers that are not saved are skipped by the decoder
        if (preserve_icc) {
            jpeg_save_markers(&srcinfo, kIccMarker, 0xFFFF);
        }

        if (jpeg_read_header(&srcinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }

        Logger::log(LogLevel::Debug,
                    std::string("JPEG ") + (srcinfo.progressive_mode ? "progressive" : "baseline") +
                    ", " + std::to_string(srcinfo.image_width) + "x" + std::to_string(srcinfo.image_height),
                    kTag);

        jvirt_barray_ptr *coef_arrays = jpeg_read_coefficients(&srcinfo);
        jpeg_copy_critical_parameters(&srcinfo, &dstinfo);

        if (srcinfo.progressive_mode) {
            jpeg_simple_progression(&dstinfo);
        }

        dstinfo.optimize_coding = TRUE;
        jpeg_stdio_dest(&dstinfo, outfile.get());
        jpeg_write_coefficients(&dstinfo, coef_arrays);

        if (preserve_icc) {
            const int kept = copy_icc_markers(&srcinfo, &dstinfo);
            Logger::log(LogLevel::Debug, "Kept " + std::to_string(kept) + " ICC segment(s)", kTag);
        }

        jpeg_finish_compress(&dstinfo);
        jpeg_finish_decompress(&srcinfo);
        jpeg_destroy_compress(&dstinfo);
        jpeg_destroy_decompress(&srcinfo);
    } catch (const std::exception& e) {
        jpeg_destroy_compress(&dstinfo);
        jpeg_destroy_decompress(&srcinfo);
        Logger::log(LogLevel::Error, "JPEG stripping failed: " + std::string(e.what()), kTag);
        throw ImageProcessingError("cannot process JPEG " + input.filename().string() + ": " + e.what());
    }

    infile.reset();
    if (std::fflush(outfile.get()) != 0 || std::ferror(outfile.get())) {
        Logger::log(LogLevel::Error, "Write error on " + output.string(), kTag);
        throw FilesystemError("write error on " + output.string());
    }
    outfile.reset();
    guard.commit();

    Logger::log(LogLevel::Info, "JPEG stripped: " + output.string(), kTag);
}

} // namespace metaclean
