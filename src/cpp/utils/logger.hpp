#pragma once
// stderr logger. Lines are written whole under a lock because upload chunks
// log from worker threads. Timestamps are UTC, like the wire format.
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <mutex>
#include <string>

namespace stmt {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

inline LogLevel g_log_level = LogLevel::INFO;

// "debug", "info", "warn" or "error"; anything else is INFO
inline LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::DEBUG;
    if (s == "warn")  return LogLevel::WARN;
    if (s == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

inline const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DBG";
        case LogLevel::INFO:  return "INF";
        case LogLevel::WARN:  return "WRN";
        case LogLevel::ERROR: return "ERR";
    }
    return "???";
}

inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

inline void log(LogLevel level, const char* fmt, ...) {
    if (level < g_log_level) return;

    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    struct tm utc{};
    gmtime_r(&secs, &utc);

    char line[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(log_mutex());
    std::fprintf(stderr, "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ %s %s\n",
        utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms),
        log_level_tag(level), line);
}

#define LOG_DBG(...) ::stmt::log(::stmt::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INF(...) ::stmt::log(::stmt::LogLevel::INFO,  __VA_ARGS__)
#define LOG_WRN(...) ::stmt::log(::stmt::LogLevel::WARN,  __VA_ARGS__)
#define LOG_ERR(...) ::stmt::log(::stmt::LogLevel::ERROR, __VA_ARGS__)

} // namespace stmt
