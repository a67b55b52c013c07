#pragma once

#include "scheduler/action.hpp"
#include "timing/instant.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cadence {

// Everything needed to register a task
struct TaskDefinition {
    std::string name;
    std::string schedule;
    std::shared_ptr<Action> action;
    std::string description;
    bool enabled = true;
    nlohmann::json parameters = nlohmann::json::object();
};

// Point-in-time copy of a registered task and its statistics
struct TaskInfo {
    std::string name;
    std::string schedule;
    std::string description;
    std::string actionName;
    bool enabled = true;
    nlohmann::json parameters = nlohmann::json::object();
    uint64_t runCount = 0;
    uint64_t failureCount = 0;
    std::optional<Instant> lastRun;
    std::optional<Instant> nextRun;
    std::optional<std::string> lastError;
};

// Multi-line human readable summary, as printed by "cadence list"
std::string formatTaskInfo(const TaskInfo& info);

nlohmann::json taskInfoToJson(const TaskInfo& info);

} // namespace cadence
