// LevelForge Core
// clock.hpp - Injectable wall clock and ISO-8601 timestamps

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace levelforge::core {

using WallTime = std::chrono::system_clock::time_point;

// Source of "now" for generated timestamps. Tests pin it to a fixed instant.
using WallClock = std::function<WallTime()>;

[[nodiscard]] WallClock system_wall_clock();

// Returns a clock that always reports the same instant
[[nodiscard]] WallClock fixed_wall_clock(WallTime instant);

// UTC, millisecond precision: "2024-03-09T14:05:00.250Z"
[[nodiscard]] std::string format_iso8601(WallTime time);

}  // namespace levelforge::core
