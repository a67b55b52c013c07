#pragma once

#include "timing/instant.hpp"
#include <cstdint>
#include <ostream>
#include <string>

namespace cadence {

// A span between two instants. end may precede start, in which case duration() is negative.
class Interval {
public:
    Interval(const Instant& start, const Instant& end);

    static Interval fromSeconds(const Instant& start, int64_t seconds);
    // end = start + duration read as a naive elapsed duration
    static Interval fromDuration(const Instant& start, const Instant& duration);

    const Instant& getStart() const { return start_; }
    const Instant& getEnd() const { return end_; }

    // end - start in seconds
    int64_t duration() const;

    // Half-open: start <= instant < end
    bool contains(const Instant& instant) const;

    Interval shiftedBy(int64_t seconds) const;
    Interval shiftedBy(const Instant& duration) const;

    std::string toString(const std::string& format = DEFAULT_INSTANT_FORMAT) const;

    bool operator==(const Interval& other) const;
    bool operator!=(const Interval& other) const { return !(*this == other); }
    // Ordered by start, then end
    bool operator<(const Interval& other) const;

private:
    Instant start_;
    Instant end_;
};

std::ostream& operator<<(std::ostream& os, const Interval& interval);

} // namespace cadence
