#ifndef METACLEAN_LOG_SINK_HPP
#define METACLEAN_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages, ordered from least to most severe.
 */
enum class LogLevel {
    Debug,   ///< Diagnostic detail (arguments passed to ffmpeg, chosen stripper...)
    Info,    ///< Normal progress of an operation
    Warning, ///< Recoverable problems, e.g. a temp file that could not be removed
    Error    ///< The current operation failed
};

/**
 * @brief Abstract destination for log messages.
 *
 * Sinks decide how (and whether) a message is delivered. The Logger
 * facade fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver a message.
     * @param level Severity of the message.
     * @param message The message text.
     * @param tag Component that emitted the message (e.g. "png_stripper").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // METACLEAN_LOG_SINK_HPP
