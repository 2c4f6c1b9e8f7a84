#ifndef METACLEAN_CONSOLE_LOG_SINK_HPP
#define METACLEAN_CONSOLE_LOG_SINK_HPP

#include "../../../libmetaclean/include/log_sink.hpp"
#include "../../../libmetaclean/include/logger.hpp"
#include "color.hpp"
#include <iomanip>
#include <iostream>

// prints messages at or above log_level; warnings and errors go to stderr
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Error;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        const bool to_stderr = level >= LogLevel::Warning;
        std::ostream& os = to_stderr ? std::cerr : std::cout;
        const char* color = level == LogLevel::Error ? RED : level == LogLevel::Warning ? YELLOW : "";

        os << color << '[' << std::left << std::setw(5) << Logger::level_to_string(level) << "][" << tag << "] "
           << message << (*color ? RESET : "") << std::endl;
    }
};

#endif // METACLEAN_CONSOLE_LOG_SINK_HPP
