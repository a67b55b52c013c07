#pragma once

#include "timing/time_format.hpp"
#include <ostream>
#include <string>

namespace cadence {

// Wall-clock time within a day, second precision
class TimeOfDay {
public:
    TimeOfDay() = default;
    // Throws InvalidCalendarValue when a field is out of range
    TimeOfDay(int hour, int minute, int second = 0);

    static TimeOfDay fromString(const std::string& text,
                                const std::string& format = DEFAULT_TIME_FORMAT);
    // Accepts [0, 86399]
    static TimeOfDay fromSeconds(int seconds);

    int hour() const { return hour_; }
    int minute() const { return minute_; }
    int second() const { return second_; }

    // Seconds elapsed since midnight
    int toSeconds() const;

    std::string toString(const std::string& format = DEFAULT_TIME_FORMAT) const;

    bool operator==(const TimeOfDay& other) const;
    bool operator!=(const TimeOfDay& other) const { return !(*this == other); }
    bool operator<(const TimeOfDay& other) const { return toSeconds() < other.toSeconds(); }
    bool operator<=(const TimeOfDay& other) const { return !(other < *this); }
    bool operator>(const TimeOfDay& other) const { return other < *this; }
    bool operator>=(const TimeOfDay& other) const { return !(*this < other); }

    static bool isValid(int hour, int minute, int second);

private:
    int hour_{0};
    int minute_{0};
    int second_{0};
};

std::ostream& operator<<(std::ostream& os, const TimeOfDay& time);

} // namespace cadence
