#include "timing/interval.hpp"

namespace cadence {

Interval::Interval(const Instant& start, const Instant& end)
    : start_(start)
    , end_(end) {
}

Interval Interval::fromSeconds(const Instant& start, int64_t seconds) {
    return Interval(start, start.plusSeconds(seconds));
}

Interval Interval::fromDuration(const Instant& start, const Instant& duration) {
    return Interval(start, start.plusNaiveDuration(duration));
}

int64_t Interval::duration() const {
    return end_ - start_;
}

bool Interval::contains(const Instant& instant) const {
    return start_ <= instant && instant < end_;
}

Interval Interval::shiftedBy(int64_t seconds) const {
    return Interval(start_.plusSeconds(seconds), end_.plusSeconds(seconds));
}

Interval Interval::shiftedBy(const Instant& duration) const {
    return shiftedBy(duration.naiveDurationSeconds());
}

std::string Interval::toString(const std::string& format) const {
    return start_.toString(format) + " - " + end_.toString(format);
}

bool Interval::operator==(const Interval& other) const {
    return start_ == other.start_ && end_ == other.end_;
}

bool Interval::operator<(const Interval& other) const {
    if (start_ != other.start_) {
        return start_ < other.start_;
    }
    return end_ < other.end_;
}

std::ostream& operator<<(std::ostream& os, const Interval& interval) {
    return os << interval.toString();
}

} // namespace cadence
