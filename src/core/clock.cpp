// LevelForge Core
// clock.cpp - Wall clock and ISO-8601 formatting

#include <levelforge/core/clock.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>

namespace levelforge::core {

namespace {

struct CivilDate {
    int64_t year;
    unsigned month;
    unsigned day;
};

// Days since 1970-01-01 to proleptic Gregorian date (Howard Hinnant's algorithm)
CivilDate civil_from_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const auto doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {m <= 2 ? y + 1 : y, m, d};
}

}  // namespace

WallClock system_wall_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

WallClock fixed_wall_clock(WallTime instant) {
    return [instant] { return instant; };
}

std::string format_iso8601(WallTime time) {
    using namespace std::chrono;

    const auto total_ms = duration_cast<milliseconds>(time.time_since_epoch()).count();
    int64_t days = total_ms / 86400000;
    int64_t ms_of_day = total_ms % 86400000;
    if (ms_of_day < 0) {
        ms_of_day += 86400000;
        --days;
    }

    const CivilDate date = civil_from_days(days);
    const int64_t hours = ms_of_day / 3600000;
    const int64_t minutes = (ms_of_day / 60000) % 60;
    const int64_t seconds = (ms_of_day / 1000) % 60;
    const int64_t millis = ms_of_day % 1000;

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", date.year, date.month, date.day, hours,
                       minutes, seconds, millis);
}

}  // namespace levelforge::core
