/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for MemQueue.
 *
 * Zero external dependencies. Every line carries a timestamp, the level
 * and a component tag. Messages use `{}` placeholders.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace memqueue {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @class Logger
 * @brief Thread-safe singleton logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("QueueWriter", "Stored {} bytes under {}", payload.size(), key);
 * @endcode
 */
class MEMQUEUE_UTILS_API Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /**
     * @brief Set the minimum log level. Messages below this are ignored.
     */
    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colors around the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output. Passing nullptr restores std::cerr.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cerr;
    }

    /**
     * @brief Canonical upper-case name of a level ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    /**
     * @brief Parse a level name, case-insensitive.
     * @param name Level name such as "debug" or "WARN".
     * @param fallback Returned when the name is not recognised.
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    template<typename... Args>
    void log(LogLevel level, const std::string& component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::ostringstream oss;

        // [YYYY-MM-DD HH:MM:SS.mmm]
        auto now = std::chrono::system_clock::now();
        auto timeNow = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tmBuf{};
#ifdef _WIN32
        localtime_s(&tmBuf, &timeNow);
#else
        localtime_r(&timeNow, &tmBuf);
#endif

        oss << "["
            << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] ";

        bool color = colorEnabled_.load(std::memory_order_relaxed);
        if (color) {
            oss << colorCode(level);
        }
        oss << "[" << std::left << std::setfill(' ') << std::setw(5) << levelName(level) << "]";
        if (color) {
            oss << "\033[0m";
        }

        oss << " [" << component << "] ";
        formatInto(oss, format, std::forward<Args>(args)...);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            *out_ << oss.str() << std::endl;
        }

        if (level == LogLevel::FATAL) {
            std::abort();
        }
    }

private:
    Logger()
        : level_(static_cast<int>(LogLevel::INFO))
        , colorEnabled_(false)
        , out_(&std::cerr)
    {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void formatInto(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    // Each `{}` consumes one argument; surplus arguments are dropped.
    template<typename T, typename... Args>
    static void formatInto(std::ostringstream& oss, const char* format, T&& value, Args&&... args) {
        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                formatInto(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format++;
        }
    }

    static const char* colorCode(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";
            case LogLevel::DEBUG: return "\033[36m";
            case LogLevel::INFO:  return "\033[32m";
            case LogLevel::WARN:  return "\033[33m";
            case LogLevel::ERROR: return "\033[31m";
            case LogLevel::FATAL: return "\033[35;1m";
            default:              return "";
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::ostream* out_;
    std::mutex mutex_;
};

}  // namespace utils
}  // namespace memqueue

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::memqueue::utils::Logger::instance().log(::memqueue::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::memqueue::utils::Logger::instance().log(::memqueue::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::memqueue::utils::Logger::instance().log(::memqueue::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::memqueue::utils::Logger::instance().log(::memqueue::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::memqueue::utils::Logger::instance().log(::memqueue::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::memqueue::utils::Logger::instance().log(::memqueue::utils::LogLevel::FATAL, component, __VA_ARGS__)
