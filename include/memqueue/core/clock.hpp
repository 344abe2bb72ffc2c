/**
 * @file clock.hpp
 * @brief Wall-clock source and the timestamp text formats stored in the cache.
 *
 * @copyright Copyright (c) 2024 MemQueue Contributors
 * @license MIT License
 */

#pragma once

#include "memqueue/core/export.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace memqueue {
namespace core {

/**
 * @class Clock
 * @brief Source of "now". Injected so tests can move time.
 */
class MEMQUEUE_CORE_API Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    virtual TimePoint now() const = 0;
};

/**
 * @class SystemClock
 * @brief Clock backed by std::chrono::system_clock.
 */
class MEMQUEUE_CORE_API SystemClock : public Clock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Seconds since the epoch as a double.
 */
MEMQUEUE_CORE_API double toEpochSeconds(Clock::TimePoint tp);

/**
 * @brief Timestamp text as stored in the cache: "1700000000.123456".
 */
MEMQUEUE_CORE_API std::string formatTimestamp(Clock::TimePoint tp);

/**
 * @brief Parse text written by formatTimestamp().
 * @return std::nullopt if the text is not a finite, non-negative number.
 */
MEMQUEUE_CORE_API std::optional<double> parseTimestamp(const std::string& text);

/**
 * @brief UTC minute stamp "YYYYMMDDHHMM" naming a bucket.
 */
MEMQUEUE_CORE_API std::string formatMinute(Clock::TimePoint tp);

}  // namespace core
}  // namespace memqueue
