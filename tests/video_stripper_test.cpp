#include "test_helpers.hpp"

#include "errors.hpp"
#include "ffmpeg_locator.hpp"
#include "process_runner.hpp"
#include "video_stripper.hpp"

#include <sstream>
#include <thread>

using namespace metaclean;
using namespace test_helpers;
using namespace std::chrono_literals;

namespace {

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(line);
    return lines;
}

} // namespace

class VideoStripperTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        input_ = dir_ / "clip.mp4";
        output_ = dir_ / "abc123_clip.mp4";
        write_bytes(input_, "pretend this is a movie");
    }

    // a stand-in for ffmpeg: records its arguments, then runs @p tail with
    // the output path in $out
    fs::path fake_ffmpeg(const std::string& tail) const {
        return write_script(dir_ / "ffmpeg",
                            "printf '%s\\n' \"$@\" > '" + (dir_ / "args.txt").string() + "'\n"
                            "for a; do out=$a; done\n" + tail);
    }

    fs::path input_;
    fs::path output_;
};

TEST_F(VideoStripperTest, InvokesFfmpegWithStreamCopyArguments) {
    VideoStripper stripper(fake_ffmpeg("printf 'video' > \"$out\"\n"));
    EXPECT_EQ(stripper.state(), VideoStripState::Idle);

    stripper.strip(input_, output_);

    EXPECT_EQ(stripper.state(), VideoStripState::Succeeded);
    ASSERT_TRUE(fs::exists(output_));

    const auto expected = stripper.build_arguments(input_, output_);
    const auto recorded = read_lines(dir_ / "args.txt");
    ASSERT_EQ(recorded.size() + 1, expected.size());
    EXPECT_TRUE(std::equal(recorded.begin(), recorded.end(), expected.begin() + 1));
}

TEST_F(VideoStripperTest, ArgumentsDropMetadataAndCopyStreams) {
    const VideoStripper stripper("/opt/ffmpeg");
    const auto args = stripper.build_arguments(input_, output_);

    auto follows = [&args](const std::string& flag, const std::string& value) {
        for (size_t i = 0; i + 1 < args.size(); ++i) {
            if (args[i] == flag && args[i + 1] == value) return true;
        }
        return false;
    };

    EXPECT_EQ(args.front(), "/opt/ffmpeg");
    EXPECT_EQ(args.back(), output_.string());
    EXPECT_TRUE(follows("-i", input_.string()));
    EXPECT_TRUE(follows("-map_metadata", "-1"));
    EXPECT_TRUE(follows("-map_chapters", "-1"));
    EXPECT_TRUE(follows("-c", "copy"));
    // the output is created empty by strip() before ffmpeg runs
    EXPECT_NE(std::find(args.begin(), args.end(), "-y"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "-n"), args.end());
}

TEST_F(VideoStripperTest, MissingToolIsReported) {
    VideoStripper stripper(dir_ / "no-ffmpeg-here");

    EXPECT_THROW(stripper.strip(input_, output_), ToolNotFoundError);
    EXPECT_EQ(stripper.state(), VideoStripState::Failed);
    EXPECT_FALSE(fs::exists(output_));
}

TEST_F(VideoStripperTest, NonExecutableToolIsReported) {
    write_bytes(dir_ / "ffmpeg", "#!/bin/sh\nexit 0\n");
    fs::permissions(dir_ / "ffmpeg", fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    VideoStripper stripper(dir_ / "ffmpeg");
    EXPECT_THROW(stripper.strip(input_, output_), ToolNotFoundError);
}

TEST_F(VideoStripperTest, NonZeroExitRemovesPartialOutput) {
    VideoStripper stripper(fake_ffmpeg("printf 'half' > \"$out\"\n"
                                       "echo 'clip.mp4: Invalid argument' >&2\n"
                                       "exit 1\n"));
    try {
        stripper.strip(input_, output_);
        FAIL() << "expected VideoProcessingError";
    } catch (const VideoProcessingError& e) {
        EXPECT_NE(std::string(e.what()).find("Invalid argument"), std::string::npos) << e.what();
    }
    EXPECT_EQ(stripper.state(), VideoStripState::Failed);
    EXPECT_FALSE(fs::exists(output_));
    EXPECT_TRUE(fs::exists(input_));
}

TEST_F(VideoStripperTest, FatalStderrWithZeroExitIsAFailure) {
    VideoStripper stripper(fake_ffmpeg("printf 'video' > \"$out\"\n"
                                       "echo 'Error while decoding stream #0:0' >&2\n"));

    EXPECT_THROW(stripper.strip(input_, output_), VideoProcessingError);
    EXPECT_FALSE(fs::exists(output_));
}

TEST_F(VideoStripperTest, EmptyOutputIsAFailure) {
    VideoStripper stripper(fake_ffmpeg(": > \"$out\"\n"));

    EXPECT_THROW(stripper.strip(input_, output_), VideoProcessingError);
    EXPECT_FALSE(fs::exists(output_));
}

TEST_F(VideoStripperTest, ExistingOutputIsNeverOverwritten) {
    write_bytes(output_, "someone else's file");
    VideoStripper stripper(fake_ffmpeg("printf 'video' > \"$out\"\n"));

    EXPECT_THROW(stripper.strip(input_, output_), OutputExistsError);
    EXPECT_EQ(stripper.state(), VideoStripState::Failed);
    EXPECT_EQ(read_bytes(output_).size(), std::string("someone else's file").size());
    EXPECT_FALSE(fs::exists(dir_ / "args.txt")) << "ffmpeg must not run";
}

TEST_F(VideoStripperTest, FailureRemovesOnlyItsOwnOutput) {
    VideoStripper stripper(fake_ffmpeg("exit 1\n"));

    EXPECT_THROW(stripper.strip(input_, output_), VideoProcessingError);
    EXPECT_FALSE(fs::exists(output_));

    write_bytes(output_, "someone else's file");
    EXPECT_THROW(stripper.strip(input_, output_), OutputExistsError);
    EXPECT_TRUE(fs::exists(output_));
}

TEST_F(VideoStripperTest, TimeoutKillsFfmpeg) {
    VideoStripper stripper(fake_ffmpeg("printf 'part' > \"$out\"\nexec sleep 5\n"), 1s);

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(stripper.strip(input_, output_), VideoProcessingError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    EXPECT_FALSE(fs::exists(output_));
    EXPECT_EQ(stripper.state(), VideoStripState::Failed);
}

TEST_F(VideoStripperTest, RequestStopCancelsRun) {
    VideoStripper stripper(fake_ffmpeg("printf 'part' > \"$out\"\nexec sleep 5\n"), 0s);

    std::thread stopper([&stripper] {
        while (stripper.state() != VideoStripState::Invoking) std::this_thread::sleep_for(5ms);
        std::this_thread::sleep_for(100ms);
        stripper.request_stop();
    });

    EXPECT_THROW(stripper.strip(input_, output_), VideoProcessingError);
    stopper.join();
    EXPECT_FALSE(fs::exists(output_));
}

TEST_F(VideoStripperTest, StopRequestedBeforeStripIsNotLost) {
    VideoStripper stripper(fake_ffmpeg("printf 'video' > \"$out\"\n"));

    stripper.request_stop();
    EXPECT_THROW(stripper.strip(input_, output_), VideoProcessingError);
    EXPECT_EQ(stripper.state(), VideoStripState::Failed);
    EXPECT_FALSE(fs::exists(output_));
    EXPECT_FALSE(fs::exists(dir_ / "args.txt")) << "ffmpeg must not run";

    // the request is consumed: the next run goes through
    stripper.strip(input_, output_);
    EXPECT_EQ(stripper.state(), VideoStripState::Succeeded);
    EXPECT_EQ(read_bytes(output_).size(), 5u);
}

TEST_F(VideoStripperTest, StderrPatterns) {
    EXPECT_TRUE(VideoStripper::stderr_indicates_failure("Conversion failed!"));
    EXPECT_TRUE(VideoStripper::stderr_indicates_failure("x.mp4: Invalid data found when processing input"));
    EXPECT_FALSE(VideoStripper::stderr_indicates_failure(""));
    EXPECT_FALSE(VideoStripper::stderr_indicates_failure("[mp4 @ 0x1] track 1: codec frame size is not set"));
}

TEST_F(VideoStripperTest, QueryVersionAcceptsFfmpeg) {
    const VideoStripper stripper(write_script(dir_ / "ffmpeg",
                                              "echo 'ffmpeg version 6.1.1 Copyright (c) 2000-2023'\n"
                                              "echo 'built with gcc'\n"));
    EXPECT_EQ(stripper.query_version(), "ffmpeg version 6.1.1 Copyright (c) 2000-2023");
}

TEST_F(VideoStripperTest, QueryVersionRejectsOtherPrograms) {
    const VideoStripper stripper(write_script(dir_ / "ffmpeg", "echo 'hello'\n"));
    EXPECT_THROW((void)stripper.query_version(), ToolNotFoundError);

    const VideoStripper missing(dir_ / "missing");
    EXPECT_THROW((void)missing.query_version(), ToolNotFoundError);
}

TEST_F(VideoStripperTest, StateNames) {
    EXPECT_EQ(to_string(VideoStripState::Idle), "Idle");
    EXPECT_EQ(to_string(VideoStripState::Invoking), "Invoking");
    EXPECT_EQ(to_string(VideoStripState::Succeeded), "Succeeded");
    EXPECT_EQ(to_string(VideoStripState::Failed), "Failed");
}

// End to end with a real ffmpeg, when one is installed.
TEST_F(VideoStripperTest, RealFfmpegDropsContainerMetadata) {
    const auto ffmpeg = find_in_path(kFfmpegExecutableName);
    if (!ffmpeg) GTEST_SKIP() << "ffmpeg not in PATH";

    const auto source = dir_ / "tagged.mp4";
    const auto made = run_process({ffmpeg->string(), "-nostdin", "-hide_banner", "-loglevel", "error",
                                   "-f", "lavfi", "-i", "testsrc=duration=1:size=64x64:rate=5",
                                   "-metadata", "title=" + std::string(kSecret),
                                   "-metadata", "location=+48.8584+002.2945/",
                                   "-c:v", "mpeg4", source.string()},
                                  60s);
    if (!made.succeeded()) GTEST_SKIP() << "cannot create a test clip: " << made.stderr_output;
    ASSERT_TRUE(contains(read_bytes(source), kSecret));

    VideoStripper stripper(*ffmpeg, 60s);
    const auto out = dir_ / "clean.mp4";
    stripper.strip(source, out);

    const auto data = read_bytes(out);
    EXPECT_FALSE(data.empty());
    EXPECT_FALSE(contains(data, kSecret));
    EXPECT_FALSE(contains(data, "+48.8584"));
}
