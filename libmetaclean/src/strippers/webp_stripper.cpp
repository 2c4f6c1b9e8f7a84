#include "../../include/webp_stripper.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <webp/mux.h>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr auto kTag = "webp_stripper";

struct WebPDataReleaser {
    void operator()(WebPData* data) const { WebPDataClear(data); }
};

struct MuxDeleter {
    void operator()(WebPMux* mux) const { if (mux) WebPMuxDelete(mux); }
};

using unique_mux = std::unique_ptr<WebPMux, MuxDeleter>;

/**
 * @brief Removes every instance of a chunk; a missing chunk is not an error.
 * @return true if the chunk was present.
 */
bool delete_chunk(WebPMux* mux, const char fourcc[4]) {
    const WebPMuxError err = WebPMuxDeleteChunk(mux, fourcc);
    if (err == WEBP_MUX_OK) {
        Logger::log(LogLevel::Debug, std::string("Removed chunk '") + std::string(fourcc, 4) + "'", kTag);
        return true;
    }
    if (err != WEBP_MUX_NOT_FOUND) {
        throw metaclean::ImageProcessingError(
            std::string("WebPMuxDeleteChunk failed for ") + std::string(fourcc, 4) +
            " (error " + std::to_string(static_cast<int>(err)) + ")");
    }
    return false;
}

} // namespace

namespace metaclean {

void WebpStripper::strip(const std::filesystem::path& input,
                         const std::filesystem::path& output,
                         const bool preserve_icc) {
    Logger::log(LogLevel::Info, "Stripping WebP: " + input.string(), kTag);

    // read input file into memory
    std::ifstream file(input, std::ios::binary | std::ios::ate);
    if (!file) {
        Logger::log(LogLevel::Error, "Cannot open WebP input: " + input.string(), kTag);
        throw FilesystemError("cannot open WebP input: " + input.string());
    }
    const std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> input_data(static_cast<size_t>(size > 0 ? size : 0));
    if (!file.read(reinterpret_cast<char*>(input_data.data()), size)) {
        Logger::log(LogLevel::Error, "Failed to read WebP input: " + input.string(), kTag);
        throw FilesystemError("failed to read WebP input: " + input.string());
    }

    const WebPData input_webp{ input_data.data(), input_data.size() };
    const unique_mux mux(WebPMuxCreate(&input_webp, 0));
    if (!mux) {
        Logger::log(LogLevel::Error, "WebPMuxCreate failed for: " + input.string(), kTag);
        throw ImageProcessingError("cannot parse WebP container: " + input.filename().string());
    }

    delete_chunk(mux.get(), "EXIF");
    delete_chunk(mux.get(), "XMP ");
    if (!preserve_icc) {
        delete_chunk(mux.get(), "ICCP");
    }

    WebPData final_data;
    WebPDataInit(&final_data);
    const std::unique_ptr<WebPData, WebPDataReleaser> final_owner(&final_data);
    if (const WebPMuxError err = WebPMuxAssemble(mux.get(), &final_data); err != WEBP_MUX_OK) {
        Logger::log(LogLevel::Error, "WebPMuxAssemble failed (error " + std::to_string(static_cast<int>(err)) + ")", kTag);
        throw ImageProcessingError("cannot rebuild WebP container: " + input.filename().string());
    }

    OutputFileGuard guard(output, kTag);
    unique_FILE out = guard.create();
    if (std::fwrite(final_data.bytes, 1, final_data.size, out.get()) != final_data.size ||
        std::fflush(out.get()) != 0 || std::ferror(out.get())) {
        Logger::log(LogLevel::Error, "Write error on " + output.string(), kTag);
        throw FilesystemError("write error on " + output.string());
    }
    out.reset();
    guard.commit();

    Logger::log(LogLevel::Info, "WebP stripped: " + output.string(), kTag);
}

} // namespace metaclean
