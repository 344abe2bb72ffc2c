/**
 * @file clock.cpp
 * @brief Timestamp formatting and parsing.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#include "memqueue/core/clock.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace memqueue {
namespace core {

double toEpochSeconds(Clock::TimePoint tp) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();
    return static_cast<double>(us) / 1e6;
}

std::string formatTimestamp(Clock::TimePoint tp) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%lld.%06lld",
                  static_cast<long long>(us / 1000000),
                  static_cast<long long>(us % 1000000));
    return buf;
}

std::optional<double> parseTimestamp(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size() ||
        !std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

std::string formatMinute(Clock::TimePoint tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tmBuf{};
#ifdef _WIN32
    gmtime_s(&tmBuf, &t);
#else
    gmtime_r(&t, &tmBuf);
#endif

    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y%m%d%H%M", &tmBuf);
    return buf;
}

}  // namespace core
}  // namespace memqueue
