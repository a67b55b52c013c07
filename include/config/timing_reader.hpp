#pragma once

#include "config/document_reader.hpp"
#include "timing/calendar_date.hpp"
#include "timing/instant.hpp"
#include "timing/interval.hpp"
#include "timing/recurring_interval.hpp"
#include "timing/time_of_day.hpp"

namespace cadence {

namespace timingkeys {

extern const KeySet DATE_STRING;
extern const KeySet DATE_FORMAT;
extern const KeySet YEAR;
extern const KeySet MONTH;
extern const KeySet DAY;

extern const KeySet TIME_STRING;
extern const KeySet TIME_FORMAT;
extern const KeySet HOUR;
extern const KeySet MINUTE;
extern const KeySet SECOND;

extern const KeySet DATETIME_STRING;
extern const KeySet INSTANT_DATE;
extern const KeySet INSTANT_TIME;

extern const KeySet INTERVAL_START;
extern const KeySet INTERVAL_END;
extern const KeySet INTERVAL_DURATION;

extern const KeySet RECURRING_FIRST;
extern const KeySet RECURRING_UNTIL;
extern const KeySet RECURRING_EVERY;

} // namespace timingkeys

// Each reader accepts either a formatted string (with an optional strftime
// pattern) or individual components. Invalid input raises DocumentFormatError.

// date: "2025-10-24" | year/month/day
CalendarDate dateFromDocument(const DocumentReader& doc);

// time: "14:30:00" | hour/minute/second, each defaulting to 0
TimeOfDay timeOfDayFromDocument(const DocumentReader& doc);

// datetime: "2025-10-24 14:30:00" | date + daytime mappings | year/month/day[/hour/minute/second]
Instant instantFromDocument(const DocumentReader& doc);

// start plus either end or duration. A duration is integer seconds or an
// instant document read as a naive duration.
Interval intervalFromDocument(const DocumentReader& doc);

// first and until are intervals; every is one offset or a list of offsets,
// each in the same form as an interval duration
RecurringInterval recurringFromDocument(const DocumentReader& doc);

} // namespace cadence
