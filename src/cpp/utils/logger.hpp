#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace harvest {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

// Serializes lines from collection workers and background loops
inline std::mutex g_log_mutex;

inline const char* log_level_str(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "??";
}

// Unknown names fall back to INFO
inline LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warn" || name == "warning") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    char message[2048];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    // UTC, same clock as the timestamps in session state
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    struct tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fprintf(stderr, "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ %-5s %s\n",
        tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms),
        log_level_str(level), message);
}

#define LOG_DBG(...) ::harvest::log(::harvest::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::harvest::log(::harvest::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::harvest::log(::harvest::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::harvest::log(::harvest::LogLevel::ERROR, __VA_ARGS__)

} // namespace harvest
