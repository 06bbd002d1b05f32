#pragma once

/**
 * Time utilities for the import pipeline
 *
 * All instants are UTC milliseconds since the Unix epoch. Formatting
 * follows ISO-8601 with millisecond precision ("2025-11-18T18:02:12.000Z"),
 * which is also the canonical text used in trade keys.
 */

#include "../types.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

namespace journal {
namespace util {

/**
 * Build a UTC instant from calendar fields.
 * Returns nullopt when the date or time of day is out of range.
 */
inline std::optional<TimestampMs> make_utc_ms(int year, int month, int day, int hour = 0, int minute = 0,
                                              int second = 0, int millis = 0) {
    using namespace std::chrono;
    year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                       std::chrono::day{static_cast<unsigned>(day)}};
    if (month < 1 || day < 1 || !ymd.ok())
        return std::nullopt;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59 || millis < 0 ||
        millis > 999)
        return std::nullopt;

    sys_days days_point{ymd};
    auto ms = duration_cast<milliseconds>(days_point.time_since_epoch()) + hours{hour} + minutes{minute} +
              seconds{second} + milliseconds{millis};
    return ms.count();
}

struct UtcFields {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
};

inline UtcFields split_utc(TimestampMs ts) {
    using namespace std::chrono;
    sys_time<milliseconds> tp{milliseconds{ts}};
    auto day_point = floor<days>(tp);
    year_month_day ymd{day_point};
    hh_mm_ss<milliseconds> tod{tp - day_point};

    UtcFields f;
    f.year = static_cast<int>(ymd.year());
    f.month = static_cast<int>(static_cast<unsigned>(ymd.month()));
    f.day = static_cast<int>(static_cast<unsigned>(ymd.day()));
    f.hour = static_cast<int>(tod.hours().count());
    f.minute = static_cast<int>(tod.minutes().count());
    f.second = static_cast<int>(tod.seconds().count());
    f.millis = static_cast<int>(tod.subseconds().count());
    return f;
}

// "2025-11-18T18:02:12.000Z"
inline std::string format_iso_ms(TimestampMs ts) {
    UtcFields f = split_utc(ts);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", f.year, f.month, f.day, f.hour, f.minute,
                  f.second, f.millis);
    return buf;
}

// "2025-11-18"
inline std::string format_date(TimestampMs ts) {
    UtcFields f = split_utc(ts);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", f.year, f.month, f.day);
    return buf;
}

// "18:02"
inline std::string format_time_hm(TimestampMs ts) {
    UtcFields f = split_utc(ts);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%02d:%02d", f.hour, f.minute);
    return buf;
}

} // namespace util
} // namespace journal
