#include "timing/instant.hpp"
#include "common/errors.hpp"
#include <algorithm>

namespace cadence {

namespace {

constexpr int64_t NAIVE_DAYS_PER_YEAR = 365;
constexpr int64_t NAIVE_DAYS_PER_MONTH = 30;
constexpr int NAIVE_EPOCH_YEAR = 1970;

// Floor division, so negative offsets land on the previous day
int64_t floorDiv(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

} // namespace

Instant::Instant(int year, int month, int day, int hour, int minute, int second)
    : date_(year, month, day)
    , time_(hour, minute, second) {
}

Instant::Instant(const CalendarDate& date, const TimeOfDay& time)
    : date_(date)
    , time_(time) {
}

Instant Instant::now() {
    std::tm now = timeformat::localNow();
    // A leap second reported by the C library is clamped into the same minute
    return Instant(now.tm_year + 1900, now.tm_mon + 1, now.tm_mday,
                   now.tm_hour, now.tm_min, std::min(now.tm_sec, 59));
}

Instant Instant::fromString(const std::string& text, const std::string& format) {
    std::tm tm{};
    if (!timeformat::parse(text, format, tm)) {
        throw InvalidCalendarValue("cannot parse instant '" + text + "' with format '" + format + "'");
    }
    return Instant(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
}

Instant Instant::fromEpochSeconds(int64_t seconds) {
    const int64_t days = floorDiv(seconds, SECONDS_PER_DAY);
    const int64_t secondOfDay = seconds - days * SECONDS_PER_DAY;
    return Instant(CalendarDate::fromDaysSinceEpoch(days),
                   TimeOfDay::fromSeconds(static_cast<int>(secondOfDay)));
}

Instant Instant::fromNaiveDuration(int64_t seconds) {
    if (seconds < 0) {
        throw InvalidCalendarValue("naive duration cannot be negative: " + std::to_string(seconds));
    }

    const int64_t days = seconds / SECONDS_PER_DAY;
    const int secondOfDay = static_cast<int>(seconds % SECONDS_PER_DAY);

    const int64_t years = days / NAIVE_DAYS_PER_YEAR;
    const int64_t dayOfYear = days % NAIVE_DAYS_PER_YEAR;
    const int64_t month = std::min<int64_t>(dayOfYear / NAIVE_DAYS_PER_MONTH, 11) + 1;
    const int64_t day = dayOfYear - (month - 1) * NAIVE_DAYS_PER_MONTH + 1;

    if (years > CalendarDate::MAX_YEAR - NAIVE_EPOCH_YEAR ||
        !CalendarDate::isValid(static_cast<int>(NAIVE_EPOCH_YEAR + years),
                               static_cast<int>(month), static_cast<int>(day))) {
        throw InvalidCalendarValue("duration of " + std::to_string(seconds) +
                                   " seconds has no naive calendar encoding");
    }

    return Instant(CalendarDate(static_cast<int>(NAIVE_EPOCH_YEAR + years),
                                static_cast<int>(month), static_cast<int>(day)),
                   TimeOfDay::fromSeconds(secondOfDay));
}

int64_t Instant::epochSeconds() const {
    return date_.daysSinceEpoch() * SECONDS_PER_DAY + time_.toSeconds();
}

int64_t Instant::naiveDurationSeconds() const {
    const int64_t days = (static_cast<int64_t>(date_.year()) - NAIVE_EPOCH_YEAR) * NAIVE_DAYS_PER_YEAR +
                         (date_.month() - 1) * NAIVE_DAYS_PER_MONTH +
                         (date_.day() - 1);
    return days * SECONDS_PER_DAY +
           time_.hour() * SECONDS_PER_HOUR +
           time_.minute() * SECONDS_PER_MINUTE +
           time_.second();
}

Instant Instant::plusSeconds(int64_t seconds) const {
    return fromEpochSeconds(epochSeconds() + seconds);
}

Instant Instant::plusNaiveDuration(const Instant& duration) const {
    return plusSeconds(duration.naiveDurationSeconds());
}

int64_t Instant::operator-(const Instant& other) const {
    return epochSeconds() - other.epochSeconds();
}

std::string Instant::toString(const std::string& format) const {
    return timeformat::format(
        timeformat::makeTm(date_.year(), date_.month(), date_.day(),
                           time_.hour(), time_.minute(), time_.second()),
        format);
}

bool Instant::operator==(const Instant& other) const {
    return date_ == other.date_ && time_ == other.time_;
}

bool Instant::operator<(const Instant& other) const {
    if (date_ != other.date_) {
        return date_ < other.date_;
    }
    return time_ < other.time_;
}

std::ostream& operator<<(std::ostream& os, const Instant& instant) {
    return os << instant.toString();
}

} // namespace cadence
