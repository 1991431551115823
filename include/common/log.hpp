/*
 * File: include/common/log.hpp
 * Project: Radar Bridge
 * Purpose: Timestamped line logging to stderr
 * Notes:
 *  - One line per call, written under a process-wide mutex
 *  - Minimum level is process-wide; debug is off unless --debug
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel
{
    debug = 0,
    info,
    warn,
    error
};

// RFC3339 UTC with milliseconds (e.g., 2025-09-12T14:59:01.234Z)
inline std::string iso8601_now_ms()
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(system_clock::now());
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline std::atomic<int> &log_threshold()
{
    static std::atomic<int> level{static_cast<int>(LogLevel::info)};
    return level;
}

inline void set_log_level(LogLevel lvl) { log_threshold().store(static_cast<int>(lvl)); }

inline bool log_enabled(LogLevel lvl) { return static_cast<int>(lvl) >= log_threshold().load(); }

inline const char *log_level_name(LogLevel lvl)
{
    switch (lvl)
    {
    case LogLevel::debug:
        return "DEBUG";
    case LogLevel::info:
        return "INFO";
    case LogLevel::warn:
        return "WARN";
    case LogLevel::error:
        return "ERROR";
    }
    return "?";
}

inline void log_line(LogLevel lvl, const char *component, const std::string &msg)
{
    if (!log_enabled(lvl))
        return;
    static std::mutex mtx;
    std::ostringstream line;
    line << '[' << iso8601_now_ms() << "] " << log_level_name(lvl) << ' ' << component << ": " << msg << '\n';
    std::scoped_lock lk(mtx);
    std::cerr << line.str();
}

inline void log_debug(const char *component, const std::string &msg) { log_line(LogLevel::debug, component, msg); }
inline void log_info(const char *component, const std::string &msg) { log_line(LogLevel::info, component, msg); }
inline void log_warn(const char *component, const std::string &msg) { log_line(LogLevel::warn, component, msg); }
inline void log_error(const char *component, const std::string &msg) { log_line(LogLevel::error, component, msg); }
