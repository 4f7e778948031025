#pragma once
#include <ctime>
#include <optional>
#include <string>

namespace utils
{

    constexpr std::time_t kSecondsPerHour = 3600;
    constexpr std::time_t kSecondsPerDay = 86400;

    // All plan timestamps are UTC epoch seconds.
    //
    // Accepted input forms:
    //   YYYY-MM-DDTHH:MM:SS[Z]
    //   YYYY-MM-DD HH:MM:SS
    //   YYYY-MM-DD            (midnight)
    std::optional<std::time_t> parse_iso8601_utc(const std::string &text);

    // YYYY-MM-DDTHH:MM:SS (no zone suffix)
    std::string format_iso8601_utc(std::time_t t);

    // Compact form used in submission ids: YYYYMMDDHHMMSS
    std::string format_compact_utc(std::time_t t);

    int hour_of_day_utc(std::time_t t);

    // Midnight UTC of the day after t
    std::time_t next_midnight_utc(std::time_t t);

} // namespace utils
