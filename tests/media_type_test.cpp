#include "test_helpers.hpp"

#include "media_type.hpp"
#include "mime_detector.hpp"

using namespace metaclean;
using namespace test_helpers;

TEST(MediaTypeTest, DetectedMimeWins) {
    const auto type = classify_media("holiday.mp4", "image/jpeg");
    EXPECT_EQ(type.kind, MediaKind::Image);
    EXPECT_EQ(type.mime, "image/jpeg");

    EXPECT_EQ(classify_media("photo.jpg", "video/quicktime").kind, MediaKind::Video);
    EXPECT_EQ(classify_media("photo.jpg", "application/pdf").kind, MediaKind::Unsupported);
}

TEST(MediaTypeTest, ExtensionUsedWhenMimeIsInconclusive) {
    EXPECT_EQ(classify_media("clip.MOV", "").kind, MediaKind::Video);
    EXPECT_EQ(classify_media("clip.mkv", "application/octet-stream").kind, MediaKind::Video);
    EXPECT_EQ(classify_media("scan.TIFF", "text/plain").kind, MediaKind::Image);

    const auto type = classify_media("photo.JPG", "");
    EXPECT_EQ(type.kind, MediaKind::Image);
    EXPECT_EQ(type.mime, "image/jpeg");
}

TEST(MediaTypeTest, UnknownExtensionIsUnsupported) {
    EXPECT_EQ(classify_media("notes.txt", "").kind, MediaKind::Unsupported);
    EXPECT_EQ(classify_media("README", "application/octet-stream").kind, MediaKind::Unsupported);
    EXPECT_EQ(classify_media("song.mp3", "audio/mpeg").kind, MediaKind::Unsupported);
}

TEST(MediaTypeTest, KindNames) {
    EXPECT_EQ(media_kind_to_string(MediaKind::Image), "image");
    EXPECT_EQ(media_kind_to_string(MediaKind::Video), "video");
    EXPECT_EQ(media_kind_to_string(MediaKind::Unsupported), "unsupported");
}

class MimeDetectorTest : public TempDirTest {};

TEST_F(MimeDetectorTest, SniffsContentNotExtension) {
    const auto jpeg = dir_ / "really_a_jpeg.png";
    write_jpeg(jpeg, 8, 8, false);
    EXPECT_EQ(MimeDetector::detect(jpeg), "image/jpeg");

    const auto png = dir_ / "really_a_png.jpg";
    write_png(png, 8, 8, false);
    EXPECT_EQ(MimeDetector::detect(png), "image/png");
}

TEST_F(MimeDetectorTest, ClassifiesRealFiles) {
    const auto png = dir_ / "picture.dat";
    write_png(png, 4, 4, false);
    EXPECT_EQ(classify_media(png).kind, MediaKind::Image);

    const auto text = dir_ / "notes.txt";
    write_bytes(text, "shopping list\n");
    EXPECT_EQ(classify_media(text).kind, MediaKind::Unsupported);
}

TEST_F(MimeDetectorTest, MissingFileYieldsEmptyMime) {
    EXPECT_TRUE(MimeDetector::detect(dir_ / "missing.jpg").empty());
}
