#pragma once

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Thread-safe Logger utility.
 * Note: the per-frame path (Session::tick) only logs at DEBUG or on
 * state changes, as console I/O can block the frame loop.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& message) {
        if (level < minLevel_.load(std::memory_order_relaxed)) return;

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

    /**
     * Drop everything below the given level (default: DEBUG, i.e. log all)
     */
    static void setLevel(LogLevel level) { minLevel_.store(level, std::memory_order_relaxed); }
    static LogLevel getLevel() { return minLevel_.load(std::memory_order_relaxed); }

    /**
     * Parse "debug" / "info" / "warn" / "error". Returns false on unknown names.
     */
    static bool parseLevel(const std::string& name, LogLevel& out) {
        if (name == "debug") { out = LogLevel::DEBUG; return true; }
        if (name == "info")  { out = LogLevel::INFO;  return true; }
        if (name == "warn")  { out = LogLevel::WARN;  return true; }
        if (name == "error") { out = LogLevel::ERROR; return true; }
        return false;
    }

    // Helper for formatted logging
    template<typename... Args>
    static void debug(Args... args) {
        if (LogLevel::DEBUG < getLevel()) return;
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::DEBUG, ss.str());
    }

    template<typename... Args>
    static void info(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::INFO, ss.str());
    }

    template<typename... Args>
    static void warn(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::WARN, ss.str());
    }

    template<typename... Args>
    static void error(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::ERROR, ss.str());
    }

private:
    inline static std::mutex mutex_;
    inline static std::atomic<LogLevel> minLevel_{LogLevel::DEBUG};
};

} // namespace core
