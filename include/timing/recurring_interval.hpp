#pragma once

#include "timing/interval.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cadence {

// An interval that repeats from a first occurrence up to a boundary.
//
// Each enumeration tick applies every offset in order to the running interval,
// so [1 day, 2 days] produces +1, +3, +4, +6, ... days. An occurrence is kept
// while its start does not pass the boundary's start. The first occurrence is
// always part of the sequence.
class RecurringInterval {
public:
    // Offsets are naive durations (see Instant::naiveDurationSeconds)
    RecurringInterval(const Interval& firstOccurrence,
                      const Interval& lastBoundary,
                      const std::vector<Instant>& offsets);

    static RecurringInterval fromOffsetSeconds(const Interval& firstOccurrence,
                                               const Interval& lastBoundary,
                                               const std::vector<int64_t>& offsetSeconds);
    static RecurringInterval daily(const Interval& firstOccurrence,
                                   const Interval& lastBoundary,
                                   int intervalDays = 1);
    static RecurringInterval weekly(const Interval& firstOccurrence,
                                    const Interval& lastBoundary,
                                    int intervalWeeks = 1);
    // Derives the boundary so that exactly count occurrences are produced
    static RecurringInterval fromCount(const Interval& firstOccurrence,
                                       const Instant& offset,
                                       int count);

    const Interval& getFirstOccurrence() const { return firstOccurrence_; }
    const Interval& getLastBoundary() const { return lastBoundary_; }
    const std::vector<int64_t>& getOffsetSeconds() const { return offsetSeconds_; }

    std::vector<Interval> occurrences() const;
    size_t countOccurrences() const;
    // First occurrence whose start is at or after instant
    std::optional<Interval> nextOccurrence(const Instant& instant) const;

    std::string toString() const;

private:
    RecurringInterval(const Interval& firstOccurrence,
                      const Interval& lastBoundary,
                      std::vector<int64_t> offsetSeconds,
                      bool);

    Interval firstOccurrence_;
    Interval lastBoundary_;
    std::vector<int64_t> offsetSeconds_;
};

std::ostream& operator<<(std::ostream& os, const RecurringInterval& recurring);

} // namespace cadence
