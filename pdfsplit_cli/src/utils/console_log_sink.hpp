#ifndef PDFSPLIT_CONSOLE_LOG_SINK_HPP
#define PDFSPLIT_CONSOLE_LOG_SINK_HPP

#include "../../../libpdfsplit/include/log_sink.hpp"
#include <iostream>

// prints messages at or above log_level; warnings and errors go to stderr
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Warning;
    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) {
            return;
        }
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }
};

#endif // PDFSPLIT_CONSOLE_LOG_SINK_HPP
