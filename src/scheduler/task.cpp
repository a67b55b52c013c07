#include "scheduler/task.hpp"
#include <sstream>

namespace cadence {

std::string formatTaskInfo(const TaskInfo& info) {
    std::ostringstream ss;
    ss << "Task: " << info.name << "\n";
    if (!info.description.empty()) {
        ss << "  Description: " << info.description << "\n";
    }
    ss << "  Schedule: " << info.schedule << "\n"
       << "  Action: " << info.actionName << "\n"
       << "  Status: " << (info.enabled ? "Enabled" : "Disabled") << "\n"
       << "  Run Count: " << info.runCount;
    if (info.failureCount > 0) {
        ss << "\n  Failures: " << info.failureCount;
    }
    if (info.lastRun) {
        ss << "\n  Last Run: " << info.lastRun->toString();
    }
    if (info.nextRun && info.enabled) {
        ss << "\n  Next Run: " << info.nextRun->toString();
    }
    if (info.lastError) {
        ss << "\n  Last Error: " << *info.lastError;
    }
    return ss.str();
}

nlohmann::json taskInfoToJson(const TaskInfo& info) {
    nlohmann::json json;
    json["name"] = info.name;
    json["schedule"] = info.schedule;
    json["description"] = info.description;
    json["action"] = info.actionName;
    json["enabled"] = info.enabled;
    json["parameters"] = info.parameters;
    json["run_count"] = info.runCount;
    json["failure_count"] = info.failureCount;
    json["last_run"] = info.lastRun ? nlohmann::json(info.lastRun->toString()) : nlohmann::json();
    json["next_run"] = info.nextRun ? nlohmann::json(info.nextRun->toString()) : nlohmann::json();
    json["last_error"] = info.lastError ? nlohmann::json(*info.lastError) : nlohmann::json();
    return json;
}

} // namespace cadence
