#pragma once

#include "timing/calendar_date.hpp"
#include "timing/time_of_day.hpp"
#include "timing/time_format.hpp"
#include <cstdint>
#include <ostream>
#include <string>

namespace cadence {

// A calendar date plus a time of day, naive local time with no timezone.
//
// An Instant can also carry an elapsed duration. That encoding is calendar-naive:
// every year counts 365 days and every month 30 days, so 1970-01-02 00:00:00
// stands for one day and 1970-01-01 02:00:00 for two hours. Use
// naiveDurationSeconds()/plusNaiveDuration() for that reading and plusSeconds()
// for real calendar arithmetic.
class Instant {
public:
    Instant(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);
    explicit Instant(const CalendarDate& date, const TimeOfDay& time = TimeOfDay());

    static Instant now();
    static Instant fromString(const std::string& text,
                              const std::string& format = DEFAULT_INSTANT_FORMAT);
    // Inverse of epochSeconds()
    static Instant fromEpochSeconds(int64_t seconds);
    // Encodes a non-negative elapsed duration in the naive 365/30 day form
    static Instant fromNaiveDuration(int64_t seconds);

    const CalendarDate& date() const { return date_; }
    const TimeOfDay& time() const { return time_; }
    int year() const { return date_.year(); }
    int month() const { return date_.month(); }
    int day() const { return date_.day(); }
    int hour() const { return time_.hour(); }
    int minute() const { return time_.minute(); }
    int second() const { return time_.second(); }

    // Wall-clock seconds since 1970-01-01 00:00:00, ignoring timezones
    int64_t epochSeconds() const;

    // Reads this value as a naive elapsed duration:
    // ((year-1970)*365 + (month-1)*30 + (day-1)) days plus the time of day
    int64_t naiveDurationSeconds() const;

    Instant plusSeconds(int64_t seconds) const;
    Instant plusNaiveDuration(const Instant& duration) const;

    Instant operator+(int64_t seconds) const { return plusSeconds(seconds); }
    Instant operator-(int64_t seconds) const { return plusSeconds(-seconds); }
    // Best-effort duration addition, see naiveDurationSeconds()
    Instant operator+(const Instant& duration) const { return plusNaiveDuration(duration); }
    // Elapsed seconds from other to this
    int64_t operator-(const Instant& other) const;

    std::string toString(const std::string& format = DEFAULT_INSTANT_FORMAT) const;

    bool operator==(const Instant& other) const;
    bool operator!=(const Instant& other) const { return !(*this == other); }
    bool operator<(const Instant& other) const;
    bool operator<=(const Instant& other) const { return !(other < *this); }
    bool operator>(const Instant& other) const { return other < *this; }
    bool operator>=(const Instant& other) const { return !(*this < other); }

private:
    CalendarDate date_;
    TimeOfDay time_;
};

std::ostream& operator<<(std::ostream& os, const Instant& instant);

} // namespace cadence
