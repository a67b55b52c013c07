#pragma once

#include "scheduler/action.hpp"
#include <ostream>
#include <string>

namespace cadence {

// Writes parameters.message followed by a newline
class PrintAction : public Action {
public:
    static constexpr const char* DEFAULT_MESSAGE = "Hello from cadence!";

    explicit PrintAction(std::ostream& out);

    std::string getName() const override { return "print"; }
    ActionResult execute(const nlohmann::json& parameters) override;

private:
    std::ostream& out_;
};

// Sends parameters.message to the Logger at parameters.level (default info)
class LogAction : public Action {
public:
    std::string getName() const override { return "log"; }
    ActionResult execute(const nlohmann::json& parameters) override;
};

// Placeholder for user hooks: reports parameters.function and its arguments
class CustomAction : public Action {
public:
    std::string getName() const override { return "custom"; }
    ActionResult execute(const nlohmann::json& parameters) override;
};

} // namespace cadence
