#pragma once

#include "scheduler/action.hpp"
#include "scheduler/scheduler.hpp"
#include "scheduler/task.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace cadence {

struct TaskConfig {
    std::string name;
    std::string schedule;
    std::string action;
    std::string description;
    bool enabled = true;
    nlohmann::json parameters = nlohmann::json::object();
};

struct SchedulerConfig {
    int pollInterval = 1;          // seconds
    std::string logFile;           // empty logs to the console only
    std::string logLevel = "info";
    std::string statusFile;        // empty disables the JSON status export
    std::vector<TaskConfig> tasks;
};

// Throws ConfigError naming the offending field, e.g. "tasks[1].schedule"
SchedulerConfig loadConfig(const std::string& path);
SchedulerConfig parseConfig(const std::string& text);
SchedulerConfig configFromNode(const YAML::Node& root);

void saveConfig(const SchedulerConfig& config, const std::string& path);
std::string configToYaml(const SchedulerConfig& config);

SchedulerConfig defaultConfig();

// Quoted scalars stay strings; plain scalars become bool, integer, float or
// string, whichever reads first. Null scalars become null.
nlohmann::json yamlToJson(const YAML::Node& node);

// Resolves the action name; throws UnknownAction
TaskDefinition createTaskDefinition(const TaskConfig& config, const ActionResolver& resolver);

// Registers every task in order. On error the tasks registered so far stay.
void populateScheduler(Scheduler& scheduler, const SchedulerConfig& config,
                       const ActionResolver& resolver);

} // namespace cadence
