// LevelForge Platform Tests
// timer_test.cpp - Timer and Deadline unit tests

#include <gtest/gtest.h>
#include <levelforge/platform/timer.hpp>

#include <chrono>
#include <thread>

using namespace levelforge::platform;

class TimerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(TimerTest, StartsNearZero) {
    Timer timer;
    EXPECT_LT(timer.elapsed_milliseconds(), 5.0);
}

TEST_F(TimerTest, MeasuresElapsedTime) {
    Timer timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    double elapsed = timer.elapsed_milliseconds();
    EXPECT_GE(elapsed, 45.0);  // Allow some tolerance
    EXPECT_LT(elapsed, 150.0);
}

TEST_F(TimerTest, ResetWorks) {
    Timer timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    timer.reset();

    EXPECT_LT(timer.elapsed_milliseconds(), 5.0);
}

TEST_F(TimerTest, ElapsedConversions) {
    Timer timer;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    double seconds = timer.elapsed_seconds();
    double milliseconds = timer.elapsed_milliseconds();

    EXPECT_NEAR(milliseconds, seconds * 1000.0, 5.0);
}

class DeadlineTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(DeadlineTest, ZeroBudgetNeverExpires) {
    Deadline deadline(std::chrono::milliseconds(0));
    EXPECT_FALSE(deadline.has_budget());

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    EXPECT_FALSE(deadline.expired());
}

TEST_F(DeadlineTest, ExpiresAfterBudget) {
    Deadline deadline(std::chrono::milliseconds(10));
    EXPECT_TRUE(deadline.has_budget());
    EXPECT_EQ(deadline.budget().count(), 10);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(deadline.expired());
    EXPECT_GE(deadline.elapsed_milliseconds(), 10.0);
}

TEST_F(DeadlineTest, GenerousBudgetNotExpired) {
    Deadline deadline(std::chrono::milliseconds(60000));
    EXPECT_FALSE(deadline.expired());
}
