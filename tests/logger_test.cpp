#include <gtest/gtest.h>

#include "logger.hpp"

#include <string>
#include <vector>

namespace {

struct Entry {
    LogLevel level;
    std::string message;
    std::string tag;
};

class CaptureSink final : public ILogSink {
public:
    explicit CaptureSink(std::vector<Entry>& entries) : entries_(entries) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        entries_.push_back({level, std::string(message), std::string(tag)});
    }

private:
    std::vector<Entry>& entries_;
};

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::clear_sinks(); }
    void TearDown() override { Logger::clear_sinks(); }
};

TEST_F(LoggerTest, NoSinkIsANoOp) {
    EXPECT_EQ(Logger::sink_count(), 0u);
    Logger::log(LogLevel::Error, "nobody listens");
}

TEST_F(LoggerTest, MessagesReachEverySink) {
    std::vector<Entry> first, second;
    Logger::add_sink(std::make_unique<CaptureSink>(first));
    Logger::add_sink(std::make_unique<CaptureSink>(second));
    Logger::add_sink(nullptr);
    EXPECT_EQ(Logger::sink_count(), 2u);

    Logger::log(LogLevel::Warning, "disk almost full", "file_utils");
    Logger::log(LogLevel::Info, "done");

    ASSERT_EQ(first.size(), 2u);
    ASSERT_EQ(second.size(), 2u);
    EXPECT_EQ(first[0].level, LogLevel::Warning);
    EXPECT_EQ(first[0].message, "disk almost full");
    EXPECT_EQ(first[0].tag, "file_utils");
    EXPECT_EQ(first[1].tag, "metaclean");
}

TEST_F(LoggerTest, ClearSinksStopsDelivery) {
    std::vector<Entry> entries;
    Logger::add_sink(std::make_unique<CaptureSink>(entries));
    Logger::clear_sinks();

    Logger::log(LogLevel::Error, "dropped");
    EXPECT_TRUE(entries.empty());
}

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    for (const auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error}) {
        EXPECT_EQ(Logger::string_to_level(Logger::level_to_string(level)), level);
    }
}

TEST_F(LoggerTest, LevelParsingIsCaseInsensitive) {
    EXPECT_EQ(Logger::string_to_level("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::string_to_level("Warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::string_to_level("NONE"), std::nullopt);
    EXPECT_EQ(Logger::string_to_level("verbose"), std::nullopt);
}
