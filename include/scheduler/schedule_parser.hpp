#pragma once

#include "scheduler/trigger.hpp"
#include <memory>
#include <string>

namespace cadence {

// Parses a recurrence phrase into a trigger:
//
//   every <unit>                 every second | minute | hour | days | week ...
//   every <n> <unit>             every 15 minutes, every 1 day
//   every day [at HH:MM]         once per day
//   every <weekday> [at HH:MM]   once per week on that day
//
// Matching is case-insensitive. Anything else raises InvalidScheduleSpec.
std::unique_ptr<Trigger> parseSchedule(const std::string& spec);

} // namespace cadence
