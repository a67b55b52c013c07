#include "timing/calendar_date.hpp"
#include "common/errors.hpp"
#include <sstream>

namespace cadence {

namespace {

// Day counting follows the proleptic Gregorian "days from civil" algorithm
int64_t daysFromCivil(int64_t year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const int64_t yearOfEra = year - era * 400;
    const int64_t shiftedMonth = month > 2 ? month - 3 : month + 9;
    const int64_t dayOfYear = (153 * shiftedMonth + 2) / 5 + day - 1;
    const int64_t dayOfEra = yearOfEra * 365 + yearOfEra / 4 - yearOfEra / 100 + dayOfYear;
    return era * 146097 + dayOfEra - 719468;
}

void civilFromDays(int64_t days, int64_t& year, int& month, int& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t dayOfEra = days - era * 146097;
    const int64_t yearOfEra = (dayOfEra - dayOfEra / 1460 + dayOfEra / 36524 - dayOfEra / 146096) / 365;
    const int64_t dayOfYear = dayOfEra - (365 * yearOfEra + yearOfEra / 4 - yearOfEra / 100);
    const int64_t shiftedMonth = (5 * dayOfYear + 2) / 153;
    day = static_cast<int>(dayOfYear - (153 * shiftedMonth + 2) / 5 + 1);
    month = static_cast<int>(shiftedMonth < 10 ? shiftedMonth + 3 : shiftedMonth - 9);
    year = yearOfEra + era * 400 + (month <= 2 ? 1 : 0);
}

} // namespace

std::string weekdayToString(Weekday day) {
    switch (day) {
        case Weekday::MONDAY:    return "monday";
        case Weekday::TUESDAY:   return "tuesday";
        case Weekday::WEDNESDAY: return "wednesday";
        case Weekday::THURSDAY:  return "thursday";
        case Weekday::FRIDAY:    return "friday";
        case Weekday::SATURDAY:  return "saturday";
        case Weekday::SUNDAY:    return "sunday";
        default:                 return "unknown";
    }
}

CalendarDate::CalendarDate(int year, int month, int day)
    : year_(year)
    , month_(month)
    , day_(day) {
    if (!isValid(year, month, day)) {
        std::ostringstream ss;
        ss << "year=" << year << ", month=" << month << ", day=" << day
           << " does not form a valid date";
        throw InvalidCalendarValue(ss.str());
    }
}

CalendarDate CalendarDate::today() {
    std::tm now = timeformat::localNow();
    return CalendarDate(now.tm_year + 1900, now.tm_mon + 1, now.tm_mday);
}

CalendarDate CalendarDate::fromString(const std::string& text, const std::string& format) {
    std::tm tm{};
    if (!timeformat::parse(text, format, tm)) {
        throw InvalidCalendarValue("cannot parse date '" + text + "' with format '" + format + "'");
    }
    return CalendarDate(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

CalendarDate CalendarDate::fromDaysSinceEpoch(int64_t days) {
    int64_t year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(days, year, month, day);
    if (year < MIN_YEAR || year > MAX_YEAR) {
        throw InvalidCalendarValue("day offset " + std::to_string(days) +
                                   " falls outside years 1..9999");
    }
    return CalendarDate(static_cast<int>(year), month, day);
}

Weekday CalendarDate::weekday() const {
    // 1970-01-01 was a Thursday
    int64_t index = (daysSinceEpoch() + 3) % 7;
    if (index < 0) {
        index += 7;
    }
    return static_cast<Weekday>(index);
}

int64_t CalendarDate::daysSinceEpoch() const {
    return daysFromCivil(year_, month_, day_);
}

CalendarDate CalendarDate::addDays(int64_t days) const {
    return fromDaysSinceEpoch(daysSinceEpoch() + days);
}

int64_t CalendarDate::operator-(const CalendarDate& other) const {
    return daysSinceEpoch() - other.daysSinceEpoch();
}

std::string CalendarDate::toString(const std::string& format) const {
    return timeformat::format(timeformat::makeTm(year_, month_, day_, 0, 0, 0), format);
}

bool CalendarDate::operator==(const CalendarDate& other) const {
    return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    if (year_ != other.year_) {
        return year_ < other.year_;
    }
    if (month_ != other.month_) {
        return month_ < other.month_;
    }
    return day_ < other.day_;
}

bool CalendarDate::isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int CalendarDate::daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool CalendarDate::isValid(int year, int month, int day) {
    if (year < MIN_YEAR || year > MAX_YEAR) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= daysInMonth(year, month);
}

std::ostream& operator<<(std::ostream& os, const CalendarDate& date) {
    return os << date.toString();
}

} // namespace cadence
