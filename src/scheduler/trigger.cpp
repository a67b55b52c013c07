#include "scheduler/trigger.hpp"
#include <stdexcept>

namespace cadence {

namespace {

int64_t unitSeconds(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::FIXED_SECONDS: return 1;
        case TriggerKind::FIXED_MINUTES: return SECONDS_PER_MINUTE;
        case TriggerKind::FIXED_HOURS:   return SECONDS_PER_HOUR;
        case TriggerKind::FIXED_DAYS:    return SECONDS_PER_DAY;
        case TriggerKind::FIXED_WEEKS:   return SECONDS_PER_WEEK;
        default:
            throw std::invalid_argument("not a fixed interval kind: " + triggerKindToString(kind));
    }
}

std::string unitName(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::FIXED_SECONDS: return "second";
        case TriggerKind::FIXED_MINUTES: return "minute";
        case TriggerKind::FIXED_HOURS:   return "hour";
        case TriggerKind::FIXED_DAYS:    return "day";
        case TriggerKind::FIXED_WEEKS:   return "week";
        default:                         return "unknown";
    }
}

} // namespace

std::string triggerKindToString(TriggerKind kind) {
    switch (kind) {
        case TriggerKind::FIXED_SECONDS: return "FixedIntervalSeconds";
        case TriggerKind::FIXED_MINUTES: return "FixedIntervalMinutes";
        case TriggerKind::FIXED_HOURS:   return "FixedIntervalHours";
        case TriggerKind::FIXED_DAYS:    return "FixedIntervalDays";
        case TriggerKind::FIXED_WEEKS:   return "FixedIntervalWeeks";
        case TriggerKind::DAILY_AT:      return "DailyAt";
        case TriggerKind::WEEKDAY_AT:    return "WeekdayAt";
        default:                         return "Unknown";
    }
}

IntervalTrigger::IntervalTrigger(TriggerKind kind, int64_t count)
    : kind_(kind)
    , count_(count)
    , intervalSeconds_(0) {
    if (count <= 0) {
        throw std::invalid_argument("interval count must be positive");
    }
    intervalSeconds_ = count * unitSeconds(kind);
}

bool IntervalTrigger::isDue(const Instant& now, const std::optional<Instant>& lastRun) const {
    if (!lastRun) {
        return true;
    }
    return now - *lastRun >= intervalSeconds_;
}

Instant IntervalTrigger::nextFire(const Instant& now, const std::optional<Instant>& lastRun) const {
    if (isDue(now, lastRun)) {
        return now;
    }
    return lastRun->plusSeconds(intervalSeconds_);
}

std::string IntervalTrigger::describe() const {
    std::string unit = unitName(kind_);
    if (count_ != 1) {
        unit += "s";
    }
    return "every " + std::to_string(count_) + " " + unit;
}

CalendarTrigger::CalendarTrigger(std::optional<Weekday> weekday,
                                 std::optional<TimeOfDay> time,
                                 int64_t windowSeconds)
    : weekday_(weekday)
    , time_(time)
    , windowSeconds_(windowSeconds) {
    if (windowSeconds <= 0) {
        throw std::invalid_argument("firing window must be positive");
    }
}

TriggerKind CalendarTrigger::getKind() const {
    return weekday_ ? TriggerKind::WEEKDAY_AT : TriggerKind::DAILY_AT;
}

Interval CalendarTrigger::windowFor(const CalendarDate& date) const {
    if (time_) {
        const Instant start(date, TimeOfDay(time_->hour(), time_->minute(), 0));
        return Interval(start, start.plusSeconds(windowSeconds_));
    }
    const Instant start(date);
    return Interval(start, start.plusSeconds(SECONDS_PER_DAY));
}

bool CalendarTrigger::matches(const CalendarDate& date) const {
    return !weekday_ || date.weekday() == *weekday_;
}

bool CalendarTrigger::firesInWindow(const CalendarDate& date, const Instant& now,
                                    const std::optional<Instant>& lastRun) const {
    if (!matches(date)) {
        return false;
    }
    const Interval window = windowFor(date);
    if (!window.contains(now)) {
        return false;
    }
    return !lastRun || *lastRun < window.getStart();
}

bool CalendarTrigger::isDue(const Instant& now, const std::optional<Instant>& lastRun) const {
    if (firesInWindow(now.date(), now, lastRun)) {
        return true;
    }
    // A window opening late yesterday can still be open now
    if (now.date() == CalendarDate(CalendarDate::MIN_YEAR, 1, 1)) {
        return false;
    }
    return firesInWindow(now.date().addDays(-1), now, lastRun);
}

Instant CalendarTrigger::nextFire(const Instant& now, const std::optional<Instant>& lastRun) const {
    if (isDue(now, lastRun)) {
        return now;
    }
    // Any weekday recurs within 8 days of today
    for (int offset = 0; offset <= 8; ++offset) {
        const CalendarDate date = now.date().addDays(offset);
        if (!matches(date)) {
            continue;
        }
        const Instant start = windowFor(date).getStart();
        if (start >= now && (!lastRun || *lastRun < start)) {
            return start;
        }
    }
    throw std::logic_error("calendar trigger found no window within 8 days");
}

std::string CalendarTrigger::describe() const {
    std::string phrase = "every " + (weekday_ ? weekdayToString(*weekday_) : std::string("day"));
    if (time_) {
        phrase += " at " + time_->toString("%H:%M");
    }
    return phrase;
}

} // namespace cadence
