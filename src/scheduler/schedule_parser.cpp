#include "scheduler/schedule_parser.hpp"
#include "common/errors.hpp"
#include "common/utils.hpp"
#include <map>
#include <vector>

namespace cadence {

namespace {

const size_t MAX_COUNT_DIGITS = 9;

const std::map<std::string, TriggerKind>& unitKinds() {
    static const std::map<std::string, TriggerKind> kinds = {
        {"second", TriggerKind::FIXED_SECONDS}, {"seconds", TriggerKind::FIXED_SECONDS},
        {"minute", TriggerKind::FIXED_MINUTES}, {"minutes", TriggerKind::FIXED_MINUTES},
        {"hour", TriggerKind::FIXED_HOURS},     {"hours", TriggerKind::FIXED_HOURS},
        {"day", TriggerKind::FIXED_DAYS},       {"days", TriggerKind::FIXED_DAYS},
        {"week", TriggerKind::FIXED_WEEKS},     {"weeks", TriggerKind::FIXED_WEEKS}
    };
    return kinds;
}

const std::map<std::string, Weekday>& weekdays() {
    static const std::map<std::string, Weekday> days = {
        {"monday", Weekday::MONDAY},
        {"tuesday", Weekday::TUESDAY},
        {"wednesday", Weekday::WEDNESDAY},
        {"thursday", Weekday::THURSDAY},
        {"friday", Weekday::FRIDAY},
        {"saturday", Weekday::SATURDAY},
        {"sunday", Weekday::SUNDAY}
    };
    return days;
}

// HH:MM with a one or two digit hour and a two digit minute
TimeOfDay parseClockTime(const std::string& spec, const std::string& token) {
    const auto colon = token.find(':');
    if (colon == std::string::npos) {
        throw InvalidScheduleSpec(spec, "expected HH:MM after 'at', got '" + token + "'");
    }
    const std::string hourText = token.substr(0, colon);
    const std::string minuteText = token.substr(colon + 1);
    if (!utils::isDigits(hourText) || hourText.size() > 2 ||
        !utils::isDigits(minuteText) || minuteText.size() != 2) {
        throw InvalidScheduleSpec(spec, "expected HH:MM after 'at', got '" + token + "'");
    }
    const int hour = std::stoi(hourText);
    const int minute = std::stoi(minuteText);
    if (!TimeOfDay::isValid(hour, minute, 0)) {
        throw InvalidScheduleSpec(spec, "time of day out of range: '" + token + "'");
    }
    return TimeOfDay(hour, minute);
}

std::unique_ptr<Trigger> parseCalendar(const std::string& spec,
                                       const std::vector<std::string>& tokens,
                                       std::optional<Weekday> weekday) {
    std::optional<TimeOfDay> time;
    if (tokens.size() == 4) {
        if (tokens[2] != "at") {
            throw InvalidScheduleSpec(spec, "expected 'at', got '" + tokens[2] + "'");
        }
        time = parseClockTime(spec, tokens[3]);
    } else if (tokens.size() != 2) {
        throw InvalidScheduleSpec(spec, "unexpected number of words");
    }
    return std::make_unique<CalendarTrigger>(weekday, time);
}

} // namespace

std::unique_ptr<Trigger> parseSchedule(const std::string& spec) {
    const std::vector<std::string> tokens = utils::splitWhitespace(utils::toLower(spec));

    if (tokens.empty() || tokens[0] != "every") {
        throw InvalidScheduleSpec(spec, "must start with 'every'");
    }
    if (tokens.size() < 2) {
        throw InvalidScheduleSpec(spec, "missing unit");
    }

    const std::string& word = tokens[1];

    if (word == "day") {
        return parseCalendar(spec, tokens, std::nullopt);
    }

    const auto day = weekdays().find(word);
    if (day != weekdays().end()) {
        return parseCalendar(spec, tokens, day->second);
    }

    const auto unit = unitKinds().find(word);
    if (unit != unitKinds().end()) {
        if (tokens.size() != 2) {
            throw InvalidScheduleSpec(spec, "unexpected words after '" + word + "'");
        }
        return std::make_unique<IntervalTrigger>(unit->second, 1);
    }

    if (utils::isDigits(word)) {
        if (word.size() > MAX_COUNT_DIGITS) {
            throw InvalidScheduleSpec(spec, "interval '" + word + "' is too large");
        }
        const int64_t count = std::stoll(word);
        if (count <= 0) {
            throw InvalidScheduleSpec(spec, "interval must be positive");
        }
        if (tokens.size() != 3) {
            throw InvalidScheduleSpec(spec, "expected 'every <n> <unit>'");
        }
        const auto countedUnit = unitKinds().find(tokens[2]);
        if (countedUnit == unitKinds().end()) {
            throw InvalidScheduleSpec(spec, "unknown time unit '" + tokens[2] + "'");
        }
        return std::make_unique<IntervalTrigger>(countedUnit->second, count);
    }

    throw InvalidScheduleSpec(spec, "unknown schedule unit '" + word + "'");
}

} // namespace cadence
