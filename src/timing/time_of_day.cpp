#include "timing/time_of_day.hpp"
#include "common/errors.hpp"
#include <sstream>

namespace cadence {

TimeOfDay::TimeOfDay(int hour, int minute, int second)
    : hour_(hour)
    , minute_(minute)
    , second_(second) {
    if (!isValid(hour, minute, second)) {
        std::ostringstream ss;
        ss << "hour=" << hour << ", minute=" << minute << ", second=" << second
           << " does not form a valid time of day";
        throw InvalidCalendarValue(ss.str());
    }
}

TimeOfDay TimeOfDay::fromString(const std::string& text, const std::string& format) {
    std::tm tm{};
    if (!timeformat::parse(text, format, tm)) {
        throw InvalidCalendarValue("cannot parse time '" + text + "' with format '" + format + "'");
    }
    return TimeOfDay(tm.tm_hour, tm.tm_min, tm.tm_sec);
}

TimeOfDay TimeOfDay::fromSeconds(int seconds) {
    if (seconds < 0 || seconds >= SECONDS_PER_DAY) {
        throw InvalidCalendarValue(std::to_string(seconds) + " seconds is not within a single day");
    }
    return TimeOfDay(seconds / 3600, (seconds % 3600) / 60, seconds % 60);
}

int TimeOfDay::toSeconds() const {
    return hour_ * 3600 + minute_ * 60 + second_;
}

std::string TimeOfDay::toString(const std::string& format) const {
    return timeformat::format(timeformat::makeTm(1970, 1, 1, hour_, minute_, second_), format);
}

bool TimeOfDay::operator==(const TimeOfDay& other) const {
    return hour_ == other.hour_ && minute_ == other.minute_ && second_ == other.second_;
}

bool TimeOfDay::isValid(int hour, int minute, int second) {
    return hour >= 0 && hour <= 23 &&
           minute >= 0 && minute <= 59 &&
           second >= 0 && second <= 59;
}

std::ostream& operator<<(std::ostream& os, const TimeOfDay& time) {
    return os << time.toString();
}

} // namespace cadence
