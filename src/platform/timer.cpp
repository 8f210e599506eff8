// LevelForge Platform Layer
// timer.cpp - Timer implementation

#include <levelforge/platform/timer.hpp>

namespace levelforge::platform {

// Timer implementation
Timer::Timer() : start_time_(Clock::now()) {}

void Timer::reset() {
    start_time_ = Clock::now();
}

Timer::Duration Timer::elapsed() const {
    return std::chrono::duration_cast<Duration>(Clock::now() - start_time_);
}

double Timer::elapsed_seconds() const {
    return std::chrono::duration<double>(elapsed()).count();
}

double Timer::elapsed_milliseconds() const {
    return std::chrono::duration<double, std::milli>(elapsed()).count();
}

// Deadline implementation
Deadline::Deadline(std::chrono::milliseconds budget) : budget_(budget) {}

bool Deadline::expired() const {
    if (!has_budget()) {
        return false;
    }
    return timer_.elapsed() >= budget_;
}

}  // namespace levelforge::platform
