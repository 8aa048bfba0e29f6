#ifndef PDFSPLIT_LOG_SINK_HPP
#define PDFSPLIT_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 *
 * Sinks use the level to filter and to choose where a line goes.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information, useful for developers
    Info,    ///< Normal progress, e.g. one line per written chapter
    Warning, ///< Recoverable problems, e.g. a skipped break page
    Error    ///< Failures that abort the split
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide how a message is delivered (console, file).
 * The Logger class fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // PDFSPLIT_LOG_SINK_HPP
