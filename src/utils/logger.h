#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel p_level) { level_ = p_level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel p_level) const { return p_level >= level_.load() && level_.load() != LogLevel::Off; }

    void write(LogLevel p_level, const char* p_file, int p_line, const std::string& p_message);

    // Accepts debug, info, warn, error, off. Throws std::invalid_argument otherwise.
    static LogLevel parse_level(const std::string& p_name);
    static const char* level_name(LogLevel p_level);

private:
    Logger() = default;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

#define LOG_AT(level, msg)                                                          \
    do {                                                                            \
        if (Logger::instance().enabled(level)) {                                    \
            std::ostringstream log_stream_;                                         \
            log_stream_ << msg;                                                     \
            Logger::instance().write(level, __FILE__, __LINE__, log_stream_.str()); \
        }                                                                           \
    } while (0)

#define LOG_DEBUG(msg) LOG_AT(LogLevel::Debug, msg)
#define LOG_INFO(msg) LOG_AT(LogLevel::Info, msg)
#define LOG_WARN(msg) LOG_AT(LogLevel::Warn, msg)
#define LOG_ERROR(msg) LOG_AT(LogLevel::Error, msg)
