#pragma once

#include "bar.hpp"
#include <optional>
#include <string>

namespace zonetrade {

/// Exchange-local position of a bar in the calendar.
struct SessionTime {
    long day_id{0};        // days since 1970-01-01 in the session timezone
    int hhmm{0};           // 930 = 09:30
    int minute_of_day{0};  // 0..1439

    long absoluteMinute() const { return day_id * 1440L + minute_of_day; }
};

/// Host-supplied clock: maps a bar to its session day and time of day.
class SessionClock {
public:
    virtual ~SessionClock() = default;

    /// std::nullopt when the bar's timestamp cannot be interpreted.
    virtual std::optional<SessionTime> sessionTime(const Bar& bar) const = 0;
};

/// Reads "YYYY-MM-DD[T ]HH:MM[:SS...]" timestamps (also "HH_MM_SS") and shifts them by a
/// fixed offset so a UTC feed can be read in exchange time. Offset 0 = timestamps are local.
class TimestampSessionClock : public SessionClock {
public:
    explicit TimestampSessionClock(int utc_offset_minutes = 0) : offset_minutes_(utc_offset_minutes) {}

    std::optional<SessionTime> sessionTime(const Bar& bar) const override;

private:
    int offset_minutes_;
};

/// Days since 1970-01-01 for a proleptic Gregorian date.
long daysFromCivil(int year, int month, int day);

/// Split a timestamp into calendar fields. Date-only timestamps give 00:00.
bool parseTimestamp(const std::string& ts, int& year, int& month, int& day, int& hour, int& minute);

} // namespace zonetrade
