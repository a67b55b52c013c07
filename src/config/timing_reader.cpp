#include "config/timing_reader.hpp"
#include "common/errors.hpp"
#include <cstdint>
#include <vector>

namespace cadence {

namespace timingkeys {

const KeySet DATE_STRING = {"date", "day_string", "day_str"};
const KeySet DATE_FORMAT = {"format", "fmt", "date_format"};
const KeySet YEAR = {"year", "y"};
const KeySet MONTH = {"month", "m"};
const KeySet DAY = {"day", "d"};

const KeySet TIME_STRING = {"time", "daytime", "time_string"};
const KeySet TIME_FORMAT = {"format", "fmt", "time_format"};
const KeySet HOUR = {"hour", "h", "hours"};
const KeySet MINUTE = {"minute", "min", "minutes"};
const KeySet SECOND = {"second", "sec", "seconds", "s"};

const KeySet DATETIME_STRING = {"datetime", "time_string", "time_str", "timestamp"};
const KeySet INSTANT_DATE = {"date", "day_part"};
const KeySet INSTANT_TIME = {"daytime", "time_part"};

const KeySet INTERVAL_START = {"start", "begin", "from"};
const KeySet INTERVAL_END = {"end", "finish", "to"};
const KeySet INTERVAL_DURATION = {"duration", "length", "duration_seconds"};

const KeySet RECURRING_FIRST = {"first"};
const KeySet RECURRING_UNTIL = {"until"};
const KeySet RECURRING_EVERY = {"every"};

} // namespace timingkeys

namespace {

std::string where(const DocumentReader& doc) {
    return doc.getPath().empty() ? std::string("document") : doc.getPath();
}

// Integer seconds, or a mapping read as an instant and decoded as a naive duration
int64_t durationSeconds(const DocumentReader& doc) {
    if (doc.isMap()) {
        return instantFromDocument(doc).naiveDurationSeconds();
    }
    if (!doc.isScalar()) {
        throw DocumentFormatError(where(doc) + ": expected seconds or a duration mapping");
    }
    try {
        return doc.getNode().as<int64_t>();
    } catch (const YAML::Exception&) {
        throw DocumentTypeError(where(doc) + ": duration must be an integer number of seconds");
    }
}

} // namespace

CalendarDate dateFromDocument(const DocumentReader& doc) {
    using namespace timingkeys;
    try {
        if (doc.has(DATE_STRING)) {
            const auto text = doc.get<std::string>(DATE_STRING);
            const auto format = doc.get<std::string>(DATE_FORMAT, DEFAULT_DATE_FORMAT);
            return CalendarDate::fromString(text, format);
        }
        if (doc.has(YEAR) && doc.has(MONTH) && doc.has(DAY)) {
            return CalendarDate(doc.get<int>(YEAR), doc.get<int>(MONTH), doc.get<int>(DAY));
        }
    } catch (const InvalidCalendarValue& e) {
        throw DocumentFormatError(where(doc) + ": " + e.what());
    }
    throw DocumentFormatError(where(doc) + ": a date needs '" + DATE_STRING.toString() +
                              "' or year/month/day fields");
}

TimeOfDay timeOfDayFromDocument(const DocumentReader& doc) {
    using namespace timingkeys;
    try {
        if (doc.has(TIME_STRING)) {
            const auto text = doc.get<std::string>(TIME_STRING);
            const auto format = doc.get<std::string>(TIME_FORMAT, DEFAULT_TIME_FORMAT);
            return TimeOfDay::fromString(text, format);
        }
        return TimeOfDay(doc.get<int>(HOUR, 0), doc.get<int>(MINUTE, 0), doc.get<int>(SECOND, 0));
    } catch (const InvalidCalendarValue& e) {
        throw DocumentFormatError(where(doc) + ": " + e.what());
    }
}

Instant instantFromDocument(const DocumentReader& doc) {
    using namespace timingkeys;
    try {
        if (doc.has(DATETIME_STRING)) {
            const auto text = doc.get<std::string>(DATETIME_STRING);
            const auto format = doc.get<std::string>(TIME_FORMAT, DEFAULT_INSTANT_FORMAT);
            return Instant::fromString(text, format);
        }
        if (doc.has(INSTANT_DATE) && doc.has(INSTANT_TIME)) {
            return Instant(dateFromDocument(doc.child(INSTANT_DATE)),
                           timeOfDayFromDocument(doc.child(INSTANT_TIME)));
        }
        if (doc.has(YEAR) && doc.has(MONTH) && doc.has(DAY)) {
            return Instant(doc.get<int>(YEAR), doc.get<int>(MONTH), doc.get<int>(DAY),
                           doc.get<int>(HOUR, 0), doc.get<int>(MINUTE, 0), doc.get<int>(SECOND, 0));
        }
    } catch (const InvalidCalendarValue& e) {
        throw DocumentFormatError(where(doc) + ": " + e.what());
    }
    throw DocumentFormatError(where(doc) + ": an instant needs '" + DATETIME_STRING.toString() +
                              "', date/daytime mappings or year/month/day fields");
}

Interval intervalFromDocument(const DocumentReader& doc) {
    using namespace timingkeys;
    if (!doc.has(INTERVAL_START)) {
        throw DocumentFormatError(where(doc) + ": an interval needs a '" +
                                  INTERVAL_START.toString() + "' field");
    }
    const Instant start = instantFromDocument(doc.child(INTERVAL_START));

    try {
        if (doc.has(INTERVAL_END)) {
            return Interval(start, instantFromDocument(doc.child(INTERVAL_END)));
        }
        if (doc.has(INTERVAL_DURATION)) {
            const auto key = *doc.findKey(INTERVAL_DURATION);
            const DocumentReader duration(doc.getNode()[key], doc.pathFor(key));
            return Interval::fromSeconds(start, durationSeconds(duration));
        }
    } catch (const InvalidCalendarValue& e) {
        throw DocumentFormatError(where(doc) + ": " + e.what());
    }
    throw DocumentFormatError(where(doc) + ": an interval needs '" + INTERVAL_END.toString() +
                              "' or '" + INTERVAL_DURATION.toString() + "'");
}

RecurringInterval recurringFromDocument(const DocumentReader& doc) {
    using namespace timingkeys;
    const Interval first = intervalFromDocument(doc.child(RECURRING_FIRST));
    const Interval until = intervalFromDocument(doc.child(RECURRING_UNTIL));

    const auto key = doc.findKey(RECURRING_EVERY);
    if (!key) {
        throw DocumentKeyError(where(doc) + ": missing '" + RECURRING_EVERY.toString() + "'");
    }
    const DocumentReader every(doc.getNode()[*key], doc.pathFor(*key));

    std::vector<int64_t> offsets;
    if (every.isSequence()) {
        for (const auto& item : every.elements()) {
            offsets.push_back(durationSeconds(item));
        }
    } else {
        offsets.push_back(durationSeconds(every));
    }

    try {
        return RecurringInterval::fromOffsetSeconds(first, until, offsets);
    } catch (const InvalidCalendarValue& e) {
        throw DocumentFormatError(every.getPath() + ": " + e.what());
    }
}

} // namespace cadence
