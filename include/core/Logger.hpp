#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Thread-safe Logger utility.
 * Messages below the minimum level are dropped before formatting,
 * so per-tick debug output costs nothing in production.
 */
class Logger {
public:
    static void setMinLevel(LogLevel level) { minLevel_ = level; }
    static LogLevel getMinLevel() { return minLevel_; }

    static bool isEnabled(LogLevel level) {
        return static_cast<int>(level) >= static_cast<int>(minLevel_.load());
    }

    static void log(LogLevel level, const std::string& message) {
        if (!isEnabled(level)) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::cout << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
                  << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: std::cout << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  std::cout << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  std::cout << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: std::cout << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        std::cout << message << std::endl;
    }

    template<typename... Args>
    static void debug(Args... args) {
        write(LogLevel::DEBUG, args...);
    }

    template<typename... Args>
    static void info(Args... args) {
        write(LogLevel::INFO, args...);
    }

    template<typename... Args>
    static void warn(Args... args) {
        write(LogLevel::WARN, args...);
    }

    template<typename... Args>
    static void error(Args... args) {
        write(LogLevel::ERROR, args...);
    }

private:
    template<typename... Args>
    static void write(LogLevel level, Args... args) {
        if (!isEnabled(level)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(level, ss.str());
    }

    inline static std::mutex mutex_;
    inline static std::atomic<LogLevel> minLevel_{LogLevel::INFO};
};

} // namespace core
