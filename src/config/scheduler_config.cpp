#include "config/scheduler_config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "scheduler/schedule_parser.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace cadence {

namespace {

const std::string YAML_STR_TAG = "tag:yaml.org,2002:str";

nlohmann::json scalarToJson(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!" || node.Tag() == YAML_STR_TAG) {
        return text;
    }

    bool boolValue = false;
    if (YAML::convert<bool>::decode(node, boolValue)) {
        return boolValue;
    }
    long long intValue = 0;
    if (YAML::convert<long long>::decode(node, intValue)) {
        return intValue;
    }
    double doubleValue = 0.0;
    if (YAML::convert<double>::decode(node, doubleValue)) {
        return doubleValue;
    }
    return text;
}

bool isNullWord(const std::string& text) {
    return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

// Strings that would read back as another type are written quoted
void emitJson(YAML::Emitter& out, const nlohmann::json& value) {
    if (value.is_object()) {
        out << YAML::BeginMap;
        for (auto it = value.begin(); it != value.end(); ++it) {
            out << YAML::Key << it.key() << YAML::Value;
            emitJson(out, it.value());
        }
        out << YAML::EndMap;
    } else if (value.is_array()) {
        out << YAML::BeginSeq;
        for (const auto& item : value) {
            emitJson(out, item);
        }
        out << YAML::EndSeq;
    } else if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (isNullWord(text) || !scalarToJson(YAML::Node(text)).is_string()) {
            out << YAML::DoubleQuoted << text;
        } else {
            out << text;
        }
    } else if (value.is_boolean()) {
        out << value.get<bool>();
    } else if (value.is_number_integer()) {
        out << value.get<long long>();
    } else if (value.is_number_float()) {
        out << value.get<double>();
    } else {
        out << YAML::Null;
    }
}

std::string requireString(const YAML::Node& node, const std::string& path) {
    if (!node.IsScalar()) {
        throw ConfigError(path + ": expected a string");
    }
    return node.Scalar();
}

std::string optionalString(const YAML::Node& node, const std::string& path) {
    if (!node || node.IsNull()) {
        return "";
    }
    return requireString(node, path);
}

TaskConfig taskFromNode(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw ConfigError(path + ": task must be a mapping");
    }

    TaskConfig task;
    for (const char* field : {"name", "schedule", "action"}) {
        if (!node[field] || node[field].IsNull()) {
            throw ConfigError(path + "." + field + ": missing required field");
        }
    }

    task.name = requireString(node["name"], path + ".name");
    if (task.name.empty()) {
        throw ConfigError(path + ".name: task name cannot be empty");
    }

    task.schedule = requireString(node["schedule"], path + ".schedule");
    try {
        parseSchedule(task.schedule);
    } catch (const InvalidScheduleSpec& e) {
        throw ConfigError(path + ".schedule: " + e.what());
    }

    task.action = requireString(node["action"], path + ".action");
    task.description = optionalString(node["description"], path + ".description");

    if (node["enabled"] && !node["enabled"].IsNull()) {
        if (!YAML::convert<bool>::decode(node["enabled"], task.enabled)) {
            throw ConfigError(path + ".enabled: expected a boolean");
        }
    }

    if (node["parameters"] && !node["parameters"].IsNull()) {
        if (!node["parameters"].IsMap()) {
            throw ConfigError(path + ".parameters: expected a mapping");
        }
        task.parameters = yamlToJson(node["parameters"]);
    }
    return task;
}

void schedulerSectionFromNode(const YAML::Node& node, SchedulerConfig& config) {
    if (!node.IsMap()) {
        throw ConfigError("scheduler: expected a mapping");
    }

    if (node["poll_interval"] && !node["poll_interval"].IsNull()) {
        if (!YAML::convert<int>::decode(node["poll_interval"], config.pollInterval) ||
            config.pollInterval <= 0) {
            throw ConfigError("scheduler.poll_interval: expected a positive integer");
        }
    }

    config.logFile = optionalString(node["log_file"], "scheduler.log_file");
    config.statusFile = optionalString(node["status_file"], "scheduler.status_file");

    if (node["log_level"] && !node["log_level"].IsNull()) {
        config.logLevel = requireString(node["log_level"], "scheduler.log_level");
        LogLevel level;
        if (!Logger::parseLogLevel(config.logLevel, level)) {
            throw ConfigError("scheduler.log_level: unknown level '" + config.logLevel + "'");
        }
    }
}

} // namespace

nlohmann::json yamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalarToJson(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(yamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& pair : node) {
                object[pair.first.as<std::string>()] = yamlToJson(pair.second);
            }
            return object;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

SchedulerConfig loadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ConfigError("Configuration file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    Logger::debug("Loading configuration from " + path);
    return parseConfig(buffer.str());
}

SchedulerConfig parseConfig(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid YAML: " + std::string(e.what()));
    }
    return configFromNode(root);
}

SchedulerConfig configFromNode(const YAML::Node& root) {
    SchedulerConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration must be a mapping");
    }

    if (root["scheduler"] && !root["scheduler"].IsNull()) {
        schedulerSectionFromNode(root["scheduler"], config);
    }

    const YAML::Node tasks = root["tasks"];
    if (!tasks || tasks.IsNull()) {
        return config;
    }
    if (!tasks.IsSequence()) {
        throw ConfigError("tasks: expected a list");
    }

    std::set<std::string> names;
    for (size_t i = 0; i < tasks.size(); ++i) {
        const std::string path = "tasks[" + std::to_string(i) + "]";
        TaskConfig task = taskFromNode(tasks[i], path);
        if (!names.insert(task.name).second) {
            throw ConfigError(path + ".name: duplicate task name '" + task.name + "'");
        }
        config.tasks.push_back(std::move(task));
    }
    return config;
}

std::string configToYaml(const SchedulerConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "scheduler" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "poll_interval" << YAML::Value << config.pollInterval;
    out << YAML::Key << "log_file" << YAML::Value << YAML::DoubleQuoted << config.logFile;
    out << YAML::Key << "log_level" << YAML::Value << config.logLevel;
    out << YAML::Key << "status_file" << YAML::Value << YAML::DoubleQuoted << config.statusFile;
    out << YAML::EndMap;

    out << YAML::Key << "tasks" << YAML::Value << YAML::BeginSeq;
    for (const auto& task : config.tasks) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value;
        emitJson(out, task.name);
        if (!task.description.empty()) {
            out << YAML::Key << "description" << YAML::Value;
            emitJson(out, task.description);
        }
        out << YAML::Key << "schedule" << YAML::Value << task.schedule;
        out << YAML::Key << "action" << YAML::Value << task.action;
        out << YAML::Key << "enabled" << YAML::Value << task.enabled;
        if (!task.parameters.empty()) {
            out << YAML::Key << "parameters" << YAML::Value;
            emitJson(out, task.parameters);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void saveConfig(const SchedulerConfig& config, const std::string& path) {
    try {
        const std::filesystem::path configPath(path);
        if (configPath.has_parent_path()) {
            std::filesystem::create_directories(configPath.parent_path());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw ConfigError("Failed to create directory for " + path + ": " + e.what());
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open configuration file for writing: " + path);
    }
    file << configToYaml(config);
    if (!file) {
        throw ConfigError("Failed to write configuration file: " + path);
    }
    Logger::info("Configuration saved to " + path);
}

SchedulerConfig defaultConfig() {
    SchedulerConfig config;
    TaskConfig task;
    task.name = "example_task";
    task.description = "An example task";
    task.schedule = "every 1 hour";
    task.action = "print";
    task.parameters = {{"message", "Hello from cadence!"}};
    config.tasks.push_back(task);
    return config;
}

TaskDefinition createTaskDefinition(const TaskConfig& config, const ActionResolver& resolver) {
    TaskDefinition definition;
    definition.name = config.name;
    definition.schedule = config.schedule;
    definition.action = resolver.resolve(config.action);
    definition.description = config.description;
    definition.enabled = config.enabled;
    definition.parameters = config.parameters.is_null() ? nlohmann::json::object() : config.parameters;
    return definition;
}

void populateScheduler(Scheduler& scheduler, const SchedulerConfig& config,
                       const ActionResolver& resolver) {
    for (const auto& task : config.tasks) {
        scheduler.addTask(createTaskDefinition(task, resolver));
    }
    Logger::info("Registered " + std::to_string(config.tasks.size()) + " task(s) from configuration");
}

} // namespace cadence
