#include "time_utils.hpp"

#include <cstdio>

namespace utils
{

    static inline bool valid_fields(const std::tm &tm)
    {
        return tm.tm_mon >= 0 && tm.tm_mon <= 11 &&
               tm.tm_mday >= 1 && tm.tm_mday <= 31 &&
               tm.tm_hour >= 0 && tm.tm_hour <= 23 &&
               tm.tm_min >= 0 && tm.tm_min <= 59 &&
               tm.tm_sec >= 0 && tm.tm_sec <= 60;
    }

    std::optional<std::time_t> parse_iso8601_utc(const std::string &text)
    {
        std::tm tm{};
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        char sep = 0;
        int consumed = 0;

        const int n = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                                  &year, &month, &day, &sep, &hour, &minute, &second, &consumed);
        if (n == 7)
        {
            if (sep != 'T' && sep != ' ')
                return std::nullopt;

            const std::string rest = text.substr(static_cast<size_t>(consumed));
            if (!rest.empty() && rest != "Z" && rest != "+00:00")
                return std::nullopt;
        }
        else
        {
            consumed = 0;
            if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3 ||
                static_cast<size_t>(consumed) != text.size())
                return std::nullopt;
            hour = minute = second = 0;
        }

        tm.tm_year = year - 1900;
        tm.tm_mon = month - 1;
        tm.tm_mday = day;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        if (!valid_fields(tm))
            return std::nullopt;

        const std::time_t t = timegm(&tm);

        // timegm rolls impossible dates over (Feb 30 -> Mar 1)
        std::tm check{};
        gmtime_r(&t, &check);
        if (check.tm_year != year - 1900 || check.tm_mon != month - 1 || check.tm_mday != day)
            return std::nullopt;

        return t;
    }

    std::string format_iso8601_utc(std::time_t t)
    {
        std::tm tm{};
        gmtime_r(&t, &tm);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
        return buf;
    }

    std::string format_compact_utc(std::time_t t)
    {
        std::tm tm{};
        gmtime_r(&t, &tm);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d%02d%02d%02d%02d%02d",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec);
        return buf;
    }

    int hour_of_day_utc(std::time_t t)
    {
        std::tm tm{};
        gmtime_r(&t, &tm);
        return tm.tm_hour;
    }

    std::time_t next_midnight_utc(std::time_t t)
    {
        return (t / kSecondsPerDay + 1) * kSecondsPerDay;
    }

} // namespace utils
