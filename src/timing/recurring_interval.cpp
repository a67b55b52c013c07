#include "timing/recurring_interval.hpp"
#include "common/errors.hpp"
#include <sstream>

namespace cadence {

namespace {

std::vector<int64_t> toOffsetSeconds(const std::vector<Instant>& offsets) {
    std::vector<int64_t> seconds;
    seconds.reserve(offsets.size());
    for (const auto& offset : offsets) {
        seconds.push_back(offset.naiveDurationSeconds());
    }
    return seconds;
}

} // namespace

RecurringInterval::RecurringInterval(const Interval& firstOccurrence,
                                     const Interval& lastBoundary,
                                     const std::vector<Instant>& offsets)
    : RecurringInterval(firstOccurrence, lastBoundary, toOffsetSeconds(offsets), true) {
}

RecurringInterval::RecurringInterval(const Interval& firstOccurrence,
                                     const Interval& lastBoundary,
                                     std::vector<int64_t> offsetSeconds,
                                     bool)
    : firstOccurrence_(firstOccurrence)
    , lastBoundary_(lastBoundary)
    , offsetSeconds_(std::move(offsetSeconds)) {
    if (offsetSeconds_.empty()) {
        throw InvalidCalendarValue("a recurring interval needs at least one offset");
    }
    for (int64_t offset : offsetSeconds_) {
        if (offset <= 0) {
            throw InvalidCalendarValue("recurrence offset of " + std::to_string(offset) +
                                       " seconds does not advance time");
        }
    }
}

RecurringInterval RecurringInterval::fromOffsetSeconds(const Interval& firstOccurrence,
                                                       const Interval& lastBoundary,
                                                       const std::vector<int64_t>& offsetSeconds) {
    return RecurringInterval(firstOccurrence, lastBoundary, offsetSeconds, true);
}

RecurringInterval RecurringInterval::daily(const Interval& firstOccurrence,
                                           const Interval& lastBoundary,
                                           int intervalDays) {
    return fromOffsetSeconds(firstOccurrence, lastBoundary,
                             {static_cast<int64_t>(intervalDays) * SECONDS_PER_DAY});
}

RecurringInterval RecurringInterval::weekly(const Interval& firstOccurrence,
                                            const Interval& lastBoundary,
                                            int intervalWeeks) {
    return fromOffsetSeconds(firstOccurrence, lastBoundary,
                             {static_cast<int64_t>(intervalWeeks) * SECONDS_PER_WEEK});
}

RecurringInterval RecurringInterval::fromCount(const Interval& firstOccurrence,
                                               const Instant& offset,
                                               int count) {
    if (count < 1) {
        throw InvalidCalendarValue("occurrence count must be at least 1, got " + std::to_string(count));
    }
    const int64_t step = offset.naiveDurationSeconds();
    if (step <= 0) {
        throw InvalidCalendarValue("recurrence offset of " + std::to_string(step) +
                                   " seconds does not advance time");
    }

    Instant lastStart = firstOccurrence.getStart();
    for (int i = 0; i < count - 1; ++i) {
        lastStart = lastStart.plusSeconds(step);
    }
    const Interval boundary(lastStart, lastStart.plusSeconds(firstOccurrence.duration()));
    return fromOffsetSeconds(firstOccurrence, boundary, {step});
}

std::vector<Interval> RecurringInterval::occurrences() const {
    std::vector<Interval> result;
    result.push_back(firstOccurrence_);

    const int64_t limit = lastBoundary_.getStart().epochSeconds();
    const int64_t length = firstOccurrence_.duration();
    int64_t start = firstOccurrence_.getStart().epochSeconds();

    // Offsets are positive and the limit is finite, so this terminates
    while (true) {
        for (int64_t offset : offsetSeconds_) {
            start += offset;
            if (start > limit) {
                return result;
            }
            const Instant occurrenceStart = Instant::fromEpochSeconds(start);
            result.emplace_back(occurrenceStart, occurrenceStart.plusSeconds(length));
        }
    }
}

size_t RecurringInterval::countOccurrences() const {
    return occurrences().size();
}

std::optional<Interval> RecurringInterval::nextOccurrence(const Instant& instant) const {
    for (const auto& occurrence : occurrences()) {
        if (occurrence.getStart() >= instant) {
            return occurrence;
        }
    }
    return std::nullopt;
}

std::string RecurringInterval::toString() const {
    std::ostringstream ss;
    ss << "RecurringInterval(first=" << firstOccurrence_
       << ", until=" << lastBoundary_
       << ", offsets=" << offsetSeconds_.size() << ")";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const RecurringInterval& recurring) {
    return os << recurring.toString();
}

} // namespace cadence
