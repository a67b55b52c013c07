#pragma once

#include "timing/time_format.hpp"
#include <cstdint>
#include <ostream>
#include <string>

namespace cadence {

enum class Weekday {
    MONDAY = 0,
    TUESDAY,
    WEDNESDAY,
    THURSDAY,
    FRIDAY,
    SATURDAY,
    SUNDAY
};

std::string weekdayToString(Weekday day);

// A Gregorian calendar day with no time-of-day component.
// Years are restricted to [1, 9999]; values are immutable once built.
class CalendarDate {
public:
    // Throws InvalidCalendarValue when the fields do not form a valid date
    CalendarDate(int year, int month, int day);

    static CalendarDate today();
    static CalendarDate fromString(const std::string& text,
                                   const std::string& format = DEFAULT_DATE_FORMAT);
    static CalendarDate fromDaysSinceEpoch(int64_t days);

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }
    Weekday weekday() const;

    // Days relative to 1970-01-01 (negative before it)
    int64_t daysSinceEpoch() const;

    CalendarDate addDays(int64_t days) const;
    CalendarDate operator+(int64_t days) const { return addDays(days); }
    CalendarDate operator-(int64_t days) const { return addDays(-days); }
    int64_t operator-(const CalendarDate& other) const;

    std::string toString(const std::string& format = DEFAULT_DATE_FORMAT) const;

    bool operator==(const CalendarDate& other) const;
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const;
    bool operator<=(const CalendarDate& other) const { return !(other < *this); }
    bool operator>(const CalendarDate& other) const { return other < *this; }
    bool operator>=(const CalendarDate& other) const { return !(*this < other); }

    static bool isLeapYear(int year);
    static int daysInMonth(int year, int month);
    static bool isValid(int year, int month, int day);

    static constexpr int MIN_YEAR = 1;
    static constexpr int MAX_YEAR = 9999;

private:
    int year_;
    int month_;
    int day_;
};

std::ostream& operator<<(std::ostream& os, const CalendarDate& date);

} // namespace cadence
