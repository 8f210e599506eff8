// LevelForge Platform Layer
// timer.hpp - Steady-clock stopwatch and generation deadlines

#pragma once

#include <chrono>

namespace levelforge::platform {

// Simple stopwatch timer using steady_clock
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    Timer();

    // Reset the timer to zero
    void reset();

    [[nodiscard]] Duration elapsed() const;
    [[nodiscard]] double elapsed_seconds() const;
    [[nodiscard]] double elapsed_milliseconds() const;

private:
    TimePoint start_time_;
};

// A budget measured from construction. A zero budget never expires.
class Deadline {
public:
    explicit Deadline(std::chrono::milliseconds budget);

    [[nodiscard]] bool has_budget() const { return budget_.count() > 0; }
    [[nodiscard]] bool expired() const;
    [[nodiscard]] std::chrono::milliseconds budget() const { return budget_; }
    [[nodiscard]] double elapsed_milliseconds() const { return timer_.elapsed_milliseconds(); }

private:
    std::chrono::milliseconds budget_;
    Timer timer_;
};

}  // namespace levelforge::platform
