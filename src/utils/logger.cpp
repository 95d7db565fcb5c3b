#include "logger.h"

#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <stdexcept>
#include <thread>

Logger& Logger::instance() {
    static Logger instance_;
    return instance_;
}

void Logger::write(LogLevel p_level, const char* p_file, int p_line, const std::string& p_message) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    const char* base = std::strrchr(p_file, '/');
    base = base ? base + 1 : p_file;

    std::lock_guard<std::mutex> lock(mutex_);
    std::clog << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
              << std::setw(3) << std::setfill('0') << millis << std::setfill(' ')
              << " [" << level_name(p_level) << "] "
              << "[" << std::this_thread::get_id() << "] "
              << base << ":" << p_line << " " << p_message << '\n';
}

LogLevel Logger::parse_level(const std::string& p_name) {
    if (p_name == "debug") return LogLevel::Debug;
    if (p_name == "info") return LogLevel::Info;
    if (p_name == "warn" || p_name == "warning") return LogLevel::Warn;
    if (p_name == "error") return LogLevel::Error;
    if (p_name == "off") return LogLevel::Off;
    throw std::invalid_argument("unknown log level: " + p_name);
}

const char* Logger::level_name(LogLevel p_level) {
    switch (p_level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}
