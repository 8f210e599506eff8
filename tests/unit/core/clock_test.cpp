// LevelForge Core Tests
// clock_test.cpp - Wall clock and timestamp formatting tests

#include <gtest/gtest.h>

#include <levelforge/core/clock.hpp>

#include <chrono>

namespace levelforge::core {
namespace {

class ClockTest : public ::testing::Test {};

TEST_F(ClockTest, FormatsEpoch) {
    EXPECT_EQ(format_iso8601(WallTime{}), "1970-01-01T00:00:00.000Z");
}

TEST_F(ClockTest, FormatsMilliseconds) {
    // 2024-03-09T14:05:00.250Z
    WallTime time{std::chrono::milliseconds(1709993100250LL)};
    EXPECT_EQ(format_iso8601(time), "2024-03-09T14:05:00.250Z");
}

// Test: Leap day resolves to February 29
TEST_F(ClockTest, FormatsLeapDay) {
    WallTime time{std::chrono::seconds(1709164800LL)};
    EXPECT_EQ(format_iso8601(time), "2024-02-29T00:00:00.000Z");
}

TEST_F(ClockTest, FixedClockIsStable) {
    WallTime instant{std::chrono::seconds(1700000000LL)};
    WallClock clock = fixed_wall_clock(instant);
    EXPECT_EQ(clock(), instant);
    EXPECT_EQ(clock(), clock());
}

TEST_F(ClockTest, SystemClockAdvances) {
    WallClock clock = system_wall_clock();
    WallTime first = clock();
    WallTime second = clock();
    EXPECT_GE(second, first);
    EXPECT_GT(first.time_since_epoch().count(), 0);
}

}  // namespace
}  // namespace levelforge::core
