#pragma once

#include <stdexcept>
#include <string>

namespace cadence {

// Base class for every error raised by the scheduler and its collaborators
class CadenceError : public std::runtime_error {
public:
    explicit CadenceError(const std::string& message)
        : std::runtime_error(message) {}
};

// Date/time fields that do not form a valid value, or a string that cannot be parsed
class InvalidCalendarValue : public CadenceError {
public:
    explicit InvalidCalendarValue(const std::string& message)
        : CadenceError("Invalid calendar value: " + message) {}
};

class InvalidScheduleSpec : public CadenceError {
public:
    InvalidScheduleSpec(const std::string& spec, const std::string& reason)
        : CadenceError("Invalid schedule specification '" + spec + "': " + reason)
        , spec_(spec) {}

    const std::string& getSpec() const { return spec_; }

private:
    std::string spec_;
};

class DuplicateTaskName : public CadenceError {
public:
    explicit DuplicateTaskName(const std::string& name)
        : CadenceError("Task with name '" + name + "' already exists")
        , name_(name) {}

    const std::string& getTaskName() const { return name_; }

private:
    std::string name_;
};

class TaskNotFound : public CadenceError {
public:
    explicit TaskNotFound(const std::string& name)
        : CadenceError("Task '" + name + "' not found")
        , name_(name) {}

    const std::string& getTaskName() const { return name_; }

private:
    std::string name_;
};

class ActionExecutionFailure : public CadenceError {
public:
    ActionExecutionFailure(const std::string& taskName, const std::string& error)
        : CadenceError("Error executing task '" + taskName + "': " + error)
        , taskName_(taskName)
        , error_(error) {}

    const std::string& getTaskName() const { return taskName_; }
    const std::string& getError() const { return error_; }

private:
    std::string taskName_;
    std::string error_;
};

class UnknownAction : public CadenceError {
public:
    explicit UnknownAction(const std::string& name)
        : CadenceError("Unknown action: " + name)
        , name_(name) {}

    const std::string& getActionName() const { return name_; }

private:
    std::string name_;
};

// Configuration file could not be read or failed validation
class ConfigError : public CadenceError {
public:
    explicit ConfigError(const std::string& message)
        : CadenceError(message) {}
};

class DocumentFormatError : public ConfigError {
public:
    explicit DocumentFormatError(const std::string& message)
        : ConfigError(message) {}
};

class DocumentKeyError : public ConfigError {
public:
    explicit DocumentKeyError(const std::string& message)
        : ConfigError(message) {}
};

class DocumentTypeError : public ConfigError {
public:
    explicit DocumentTypeError(const std::string& message)
        : ConfigError(message) {}
};

} // namespace cadence
