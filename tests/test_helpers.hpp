#ifndef METACLEAN_TEST_HELPERS_HPP
#define METACLEAN_TEST_HELPERS_HPP

#include <gtest/gtest.h>

#include "file_utils.hpp"
#include "random_utils.hpp"

#include <jpeglib.h>
#include <png.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace test_helpers {

inline constexpr std::string_view kSecret = "SECRET-GPS-48.8584N";

// --- files ---

inline std::vector<unsigned char> read_bytes(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline void write_bytes(const fs::path& path, const std::string_view data) {
    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline bool contains(const std::vector<unsigned char>& haystack, const std::string_view needle) {
    return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) != haystack.end();
}

inline std::vector<fs::path> list_dir(const fs::path& dir) {
    std::vector<fs::path> out;
    for (const auto& e : fs::directory_iterator(dir)) out.push_back(e.path());
    std::sort(out.begin(), out.end());
    return out;
}

/**
 * @brief Writes an executable /bin/sh script.
 */
inline fs::path write_script(const fs::path& path, const std::string& body) {
    write_bytes(path, "#!/bin/sh\n" + body);
    fs::permissions(path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
}

/**
 * @brief Fixture giving every test its own scratch directory.
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::path(::testing::TempDir()) /
               ("metaclean_" + std::string(info->name()) + "_" +
                RandomUtils::to_base36(RandomUtils::next_u64(), 8));
        fs::create_directories(dir_);
        ASSERT_TRUE(fs::is_directory(dir_));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
};

// --- jpeg ---

inline std::vector<unsigned char> rgb_gradient(const int w, const int h) {
    std::vector<unsigned char> px(static_cast<size_t>(w) * h * 3);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            unsigned char* p = &px[(static_cast<size_t>(y) * w + x) * 3];
            p[0] = static_cast<unsigned char>(x * 255 / std::max(1, w - 1));
            p[1] = static_cast<unsigned char>(y * 255 / std::max(1, h - 1));
            p[2] = static_cast<unsigned char>((x + y) % 256);
        }
    }
    return px;
}

inline std::vector<unsigned char> icc_segment() {
    std::vector<unsigned char> seg = {'I', 'C', 'C', '_', 'P', 'R', 'O', 'F', 'I', 'L', 'E', '\0', 1, 1};
    for (int i = 0; i < 128; ++i) seg.push_back(static_cast<unsigned char>(i));
    return seg;
}

/**
 * @brief Encodes a gradient JPEG. With @p with_metadata it carries EXIF,
 * XMP, IPTC, a comment and an ICC profile, each holding kSecret where
 * the format allows text.
 */
inline void write_jpeg(const fs::path& path, const int w, const int h,
                       const bool with_metadata, const bool progressive = false) {
    FILE* f = std::fopen(path.string().c_str(), "wb");
    if (!f) throw std::runtime_error("cannot create " + path.string());

    jpeg_compress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_compress(&cinfo);
    jpeg_stdio_dest(&cinfo, f);

    cinfo.image_width = static_cast<JDIMENSION>(w);
    cinfo.image_height = static_cast<JDIMENSION>(h);
    cinfo.input_components = 3;
    cinfo.in_color_space = JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, 90, TRUE);
    if (progressive) jpeg_simple_progression(&cinfo);

    jpeg_start_compress(&cinfo, TRUE);

    if (with_metadata) {
        const std::string exif = std::string("Exif\0\0", 6) + "MM\0*GPSInfo " + std::string(kSecret);
        jpeg_write_marker(&cinfo, JPEG_APP0 + 1, reinterpret_cast<const JOCTET*>(exif.data()),
                          static_cast<unsigned>(exif.size()));

        const std::string xmp = std::string("http://ns.adobe.com/xap/1.0/\0", 29) +
                                "<x:xmpmeta><dc:creator>" + std::string(kSecret) + "</dc:creator></x:xmpmeta>";
        jpeg_write_marker(&cinfo, JPEG_APP0 + 1, reinterpret_cast<const JOCTET*>(xmp.data()),
                          static_cast<unsigned>(xmp.size()));

        const std::string iptc = std::string("Photoshop 3.0\0", 14) + "8BIM" + std::string(kSecret);
        jpeg_write_marker(&cinfo, JPEG_APP0 + 13, reinterpret_cast<const JOCTET*>(iptc.data()),
                          static_cast<unsigned>(iptc.size()));

        const std::string comment = "shot by " + std::string(kSecret);
        jpeg_write_marker(&cinfo, JPEG_COM, reinterpret_cast<const JOCTET*>(comment.data()),
                          static_cast<unsigned>(comment.size()));

        const auto icc = icc_segment();
        jpeg_write_marker(&cinfo, JPEG_APP0 + 2, icc.data(), static_cast<unsigned>(icc.size()));
    }

    const auto px = rgb_gradient(w, h);
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(&px[static_cast<size_t>(cinfo.next_scanline) * w * 3]);
        jpeg_write_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);
    std::fclose(f);
}

struct JpegSegment {
    int marker;
    std::vector<unsigned char> payload;
};

/**
 * @brief Lists the marker segments found before the first SOS.
 */
inline std::vector<JpegSegment> jpeg_segments(const fs::path& path) {
    const auto data = read_bytes(path);
    std::vector<JpegSegment> out;
    if (data.size() < 4 || data[0] != 0xFF || data[1] != 0xD8) return out;

    size_t pos = 2;
    while (pos + 4 <= data.size()) {
        if (data[pos] != 0xFF) break;
        while (pos < data.size() && data[pos] == 0xFF) ++pos;
        if (pos >= data.size()) break;
        const int marker = data[pos++];
        if (marker == 0xD9) break;
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) continue;
        if (pos + 2 > data.size()) break;
        const size_t len = (static_cast<size_t>(data[pos]) << 8) | data[pos + 1];
        if (len < 2 || pos + len > data.size()) break;
        out.push_back({marker, std::vector<unsigned char>(data.begin() + static_cast<long>(pos) + 2,
                                                          data.begin() + static_cast<long>(pos + len))});
        if (marker == 0xDA) break;
        pos += len;
    }
    return out;
}

inline bool has_segment(const std::vector<JpegSegment>& segs, const int marker) {
    return std::any_of(segs.begin(), segs.end(), [&](const JpegSegment& s) { return s.marker == marker; });
}

/**
 * @brief Decodes a JPEG to interleaved RGB.
 */
inline std::vector<unsigned char> decode_jpeg(const fs::path& path, int& w, int& h, bool* progressive = nullptr) {
    FILE* f = std::fopen(path.string().c_str(), "rb");
    if (!f) throw std::runtime_error("cannot open " + path.string());

    jpeg_decompress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jpeg_create_decompress(&cinfo);
    jpeg_stdio_src(&cinfo, f);
    jpeg_read_header(&cinfo, TRUE);
    if (progressive) *progressive = jpeg_has_multiple_scans(&cinfo);
    cinfo.out_color_space = JCS_RGB;
    jpeg_start_decompress(&cinfo);

    w = static_cast<int>(cinfo.output_width);
    h = static_cast<int>(cinfo.output_height);
    std::vector<unsigned char> px(static_cast<size_t>(w) * h * 3);
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = &px[static_cast<size_t>(cinfo.output_scanline) * w * 3];
        jpeg_read_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);
    std::fclose(f);
    return px;
}

// --- png ---

inline void png_throw(png_structp, const png_const_charp msg) {
    throw std::runtime_error(msg);
}

inline void png_ignore_warning(png_structp, png_const_charp) {}

enum class PngKind { Rgba, Palette };

/**
 * @brief Writes a PNG with tEXt, tIME, eXIf, pHYs and gAMA chunks when
 * @p with_metadata is set.
 */
inline void write_png(const fs::path& path, const int w, const int h, const bool with_metadata,
                      const PngKind kind = PngKind::Rgba, const bool interlaced = false) {
    const metaclean::unique_FILE f(metaclean::open_file(path, "wb"));
    if (!f) throw std::runtime_error("cannot create " + path.string());

    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_throw, png_ignore_warning);
    png_infop info = png_create_info_struct(png);
    struct Guard {
        png_structp& p;
        png_infop& i;
        ~Guard() { png_destroy_write_struct(&p, &i); }
    } guard{png, info};

    png_init_io(png, f.get());

    const int color_type = kind == PngKind::Palette ? PNG_COLOR_TYPE_PALETTE : PNG_COLOR_TYPE_RGBA;
    png_set_IHDR(png, info, static_cast<png_uint_32>(w), static_cast<png_uint_32>(h), 8, color_type,
                 interlaced ? PNG_INTERLACE_ADAM7 : PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);

    png_color palette[4] = {{0, 0, 0}, {255, 0, 0}, {0, 255, 0}, {0, 0, 255}};
    png_byte trans[4] = {0, 128, 255, 255};
    if (kind == PngKind::Palette) {
        png_set_PLTE(png, info, palette, 4);
        png_set_tRNS(png, info, trans, 4, nullptr);
    }

    std::string author_key = "Author";
    std::string author_value(kSecret);
    png_text text{};
    png_time mod_time{};
    std::vector<png_byte> exif = {'M', 'M', 0, 42};
    exif.insert(exif.end(), kSecret.begin(), kSecret.end());

    if (with_metadata) {
        text.compression = PNG_TEXT_COMPRESSION_NONE;
        text.key = author_key.data();
        text.text = author_value.data();
        png_set_text(png, info, &text, 1);

        mod_time.year = 2024;
        mod_time.month = 5;
        mod_time.day = 17;
        png_set_tIME(png, info, &mod_time);

        png_set_eXIf_1(png, info, static_cast<png_uint_32>(exif.size()), exif.data());
        png_set_pHYs(png, info, 11811, 11811, PNG_RESOLUTION_METER);
        png_set_gAMA_fixed(png, info, 45455);
    }

    png_write_info(png, info);

    const size_t channels = kind == PngKind::Palette ? 1 : 4;
    std::vector<unsigned char> px(static_cast<size_t>(w) * h * channels);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            unsigned char* p = &px[(static_cast<size_t>(y) * w + x) * channels];
            if (kind == PngKind::Palette) {
                p[0] = static_cast<unsigned char>((x + y) % 4);
            } else {
                p[0] = static_cast<unsigned char>(x * 7);
                p[1] = static_cast<unsigned char>(y * 5);
                p[2] = static_cast<unsigned char>(x ^ y);
                p[3] = static_cast<unsigned char>(255 - x);
            }
        }
    }
    std::vector<png_bytep> rows(static_cast<size_t>(h));
    for (int y = 0; y < h; ++y) rows[static_cast<size_t>(y)] = &px[static_cast<size_t>(y) * w * channels];

    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
}

/**
 * @brief Chunk types of a PNG file, in file order.
 */
inline std::vector<std::string> png_chunks(const fs::path& path) {
    const auto data = read_bytes(path);
    std::vector<std::string> out;
    size_t pos = 8;
    while (pos + 12 <= data.size()) {
        const size_t len = (static_cast<size_t>(data[pos]) << 24) | (static_cast<size_t>(data[pos + 1]) << 16) |
                           (static_cast<size_t>(data[pos + 2]) << 8) | data[pos + 3];
        out.emplace_back(reinterpret_cast<const char*>(&data[pos + 4]), 4);
        pos += 12 + len;
    }
    return out;
}

inline bool has_chunk(const std::vector<std::string>& chunks, const std::string& type) {
    return std::find(chunks.begin(), chunks.end(), type) != chunks.end();
}

/**
 * @brief Decodes any PNG to 8-bit RGBA with the simplified libpng API.
 */
inline std::vector<unsigned char> decode_png_rgba(const fs::path& path, png_uint_32& w, png_uint_32& h) {
    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_file(&image, path.string().c_str())) {
        throw std::runtime_error(std::string("png decode: ") + image.message);
    }
    image.format = PNG_FORMAT_RGBA;
    std::vector<unsigned char> px(PNG_IMAGE_SIZE(image));
    if (!png_image_finish_read(&image, nullptr, px.data(), 0, nullptr)) {
        png_image_free(&image);
        throw std::runtime_error(std::string("png decode: ") + image.message);
    }
    w = image.width;
    h = image.height;
    return px;
}

} // namespace test_helpers

#endif // METACLEAN_TEST_HELPERS_HPP
