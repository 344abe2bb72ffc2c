/**
 * @file test_clock.cpp
 * @brief Unit tests for timestamp and minute-stamp helpers
 */

#include <gtest/gtest.h>
#include <memqueue/core/clock.hpp>

#include "support/manual_clock.hpp"

#include <chrono>

using namespace memqueue::core;
using memqueue::testing::ManualClock;

namespace {

Clock::TimePoint at(long long seconds, long long micros = 0) {
    return Clock::TimePoint(std::chrono::seconds(seconds) + std::chrono::microseconds(micros));
}

}  // namespace

TEST(ClockTest, FormatTimestampHasSixFractionDigits) {
    EXPECT_EQ(formatTimestamp(at(1705314600)), "1705314600.000000");
    EXPECT_EQ(formatTimestamp(at(1705314600, 42)), "1705314600.000042");
    EXPECT_EQ(formatTimestamp(at(1705314600, 123456)), "1705314600.123456");
}

TEST(ClockTest, EpochSeconds) {
    EXPECT_DOUBLE_EQ(toEpochSeconds(at(100, 500000)), 100.5);
}

TEST(ClockTest, ParseTimestampAcceptsFormattedValue) {
    auto parsed = parseTimestamp(formatTimestamp(at(1705314600, 250000)));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_NEAR(*parsed, 1705314600.25, 1e-6);

    ASSERT_TRUE(parseTimestamp("12").has_value());
    EXPECT_DOUBLE_EQ(*parseTimestamp("12"), 12.0);
}

TEST(ClockTest, ParseTimestampRejectsJunk) {
    EXPECT_FALSE(parseTimestamp("").has_value());
    EXPECT_FALSE(parseTimestamp("abc").has_value());
    EXPECT_FALSE(parseTimestamp("12.5x").has_value());
    EXPECT_FALSE(parseTimestamp("-3").has_value());
    EXPECT_FALSE(parseTimestamp("inf").has_value());
    EXPECT_FALSE(parseTimestamp("nan").has_value());
}

TEST(ClockTest, FormatMinuteIsUtc) {
    // 2024-01-15 10:30:00 UTC
    EXPECT_EQ(formatMinute(at(1705314600)), "202401151030");
    EXPECT_EQ(formatMinute(at(1705314600 + 59)), "202401151030");
    EXPECT_EQ(formatMinute(at(1705314600 + 60)), "202401151031");
}

TEST(ClockTest, FormatMinuteAcrossDayBoundary) {
    // 2023-12-31 23:59:30 UTC
    EXPECT_EQ(formatMinute(at(1704067170)), "202312312359");
    EXPECT_EQ(formatMinute(at(1704067170 + 30)), "202401010000");
}

TEST(ClockTest, ManualClockAdvances) {
    ManualClock clock;
    auto start = clock.now();
    clock.advance(std::chrono::seconds(90));
    EXPECT_EQ(clock.now() - start, std::chrono::seconds(90));
}
