/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used by every metaclean component.
 */

#ifndef METACLEAN_LOGGER_HPP
#define METACLEAN_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Global entry point for logging.
 *
 * Messages are forwarded to every registered ILogSink. With no sink
 * installed (the default for library users) logging is a no-op.
 */
class Logger {
public:
    /**
     * @brief Register a sink. The Logger takes ownership.
     * @param sink Sink implementation; null pointers are ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /// @brief Remove every registered sink.
    static void clear_sinks();

    /// @return Number of registered sinks.
    static std::size_t sink_count();

    /**
     * @brief Send a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "metaclean").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "metaclean");

    /**
     * @brief Converts a LogLevel to the label printed by the sinks.
     * @return "DEBUG", "INFO", "WARN" or "ERROR".
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parses a level name as accepted on the command line.
     *
     * Case-insensitive; accepts "WARN" and "WARNING". "NONE" and unknown
     * names yield std::nullopt, meaning "do not log".
     */
    static std::optional<LogLevel> string_to_level(const std::string& level);

private:
    ///< Registered sinks.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Guards sinks_ and serialises delivery.
    static std::mutex mtx_;
};

#endif // METACLEAN_LOGGER_HPP
