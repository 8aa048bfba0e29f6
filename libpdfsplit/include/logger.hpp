/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the single entry point for logging inside libpdfsplit. It
 * delegates every message to the registered ILogSink implementations.
 */

#ifndef PDFSPLIT_LOGGER_HPP
#define PDFSPLIT_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Static logging facade for pdfsplit.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "pdfsplit").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "pdfsplit");

    /**
     * @brief Converts a LogLevel enum to its string representation.
     * @param level The enum value.
     * @return A constant string (e.g., "DEBUG", "INFO").
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
     * @brief Converts a level name to its LogLevel value.
     *
     * Case-insensitive. Accepts "WARN" as well as "WARNING".
     * @param level The string value (e.g., "DEBUG", "info").
     * @return The matching level, or std::nullopt for an unknown name.
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to the sinks_ vector.
    static std::mutex mtx_;
};

#endif //PDFSPLIT_LOGGER_HPP
