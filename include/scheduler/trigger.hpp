#pragma once

#include "timing/calendar_date.hpp"
#include "timing/instant.hpp"
#include "timing/interval.hpp"
#include "timing/time_of_day.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace cadence {

enum class TriggerKind {
    FIXED_SECONDS,
    FIXED_MINUTES,
    FIXED_HOURS,
    FIXED_DAYS,
    FIXED_WEEKS,
    DAILY_AT,
    WEEKDAY_AT
};

std::string triggerKindToString(TriggerKind kind);

// Decides when a task is due. A trigger holds no run state of its own, the
// caller passes the task's last run with every query.
class Trigger {
public:
    virtual ~Trigger() = default;

    virtual TriggerKind getKind() const = 0;
    virtual bool isDue(const Instant& now, const std::optional<Instant>& lastRun) const = 0;
    // Earliest instant >= now at which isDue would hold
    virtual Instant nextFire(const Instant& now, const std::optional<Instant>& lastRun) const = 0;
    // Canonical schedule phrase that parses back to an equivalent trigger
    virtual std::string describe() const = 0;
};

// Fires when at least count units have elapsed since the last run
class IntervalTrigger : public Trigger {
public:
    IntervalTrigger(TriggerKind kind, int64_t count);

    TriggerKind getKind() const override { return kind_; }
    bool isDue(const Instant& now, const std::optional<Instant>& lastRun) const override;
    Instant nextFire(const Instant& now, const std::optional<Instant>& lastRun) const override;
    std::string describe() const override;

    int64_t getCount() const { return count_; }
    int64_t getIntervalSeconds() const { return intervalSeconds_; }

private:
    TriggerKind kind_;
    int64_t count_;
    int64_t intervalSeconds_;
};

// Fires once per matching day, inside a window that opens at the configured
// time (or at midnight when no time is given).
class CalendarTrigger : public Trigger {
public:
    static constexpr int64_t DEFAULT_WINDOW_SECONDS = 60;

    // Without a weekday this is a daily trigger
    CalendarTrigger(std::optional<Weekday> weekday,
                    std::optional<TimeOfDay> time,
                    int64_t windowSeconds = DEFAULT_WINDOW_SECONDS);

    TriggerKind getKind() const override;
    bool isDue(const Instant& now, const std::optional<Instant>& lastRun) const override;
    Instant nextFire(const Instant& now, const std::optional<Instant>& lastRun) const override;
    std::string describe() const override;

    const std::optional<Weekday>& getWeekday() const { return weekday_; }
    const std::optional<TimeOfDay>& getTime() const { return time_; }

    // Firing window on the given day; the caller checks the weekday
    Interval windowFor(const CalendarDate& date) const;

private:
    bool matches(const CalendarDate& date) const;
    bool firesInWindow(const CalendarDate& date, const Instant& now,
                       const std::optional<Instant>& lastRun) const;

    std::optional<Weekday> weekday_;
    std::optional<TimeOfDay> time_;
    int64_t windowSeconds_;
};

} // namespace cadence
