#pragma once
#ifndef LOG_UTILS_H
#define LOG_UTILS_H

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

/**
 * Cross platform safe localtime wrapper.
 * windows -> localtime_s
 * Linux/Unix -> localtime_r
 */
inline std::tm safe_localtime(std::time_t time){
    std::tm tm_buf{};
#if defined(_WIN32) || defined(_WIN64)
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

/**
 * Write "[YYYY-MM-DD HH:MM:SS] [component] message" to stderr.
 * Lines from concurrent callers never interleave.
 */
inline void log_line(const std::string& component, const std::string& message){
    static std::mutex log_mutex;
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf = safe_localtime(now);

    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << "[" << std::put_time(&tm_buf, "%F %T") << "] "
              << "[" << component << "] " << message << std::endl;
}

#endif // LOG_UTILS_H
