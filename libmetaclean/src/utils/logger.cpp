#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

std::size_t Logger::sink_count() {
    std::lock_guard lock(mtx_);
    return sinks_.size();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

std::optional<LogLevel> Logger::string_to_level(const std::string& level) {
    std::string upper = level;
    std::ranges::transform(upper, upper.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}
