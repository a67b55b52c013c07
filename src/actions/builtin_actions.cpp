#include "actions/builtin_actions.hpp"
#include "common/logger.hpp"

namespace cadence {

namespace {

// Strings are used verbatim, anything else in its JSON form
std::string textParameter(const nlohmann::json& parameters, const std::string& key,
                          const std::string& fallback) {
    if (!parameters.is_object()) {
        return fallback;
    }
    auto it = parameters.find(key);
    if (it == parameters.end() || it->is_null()) {
        return fallback;
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

} // namespace

PrintAction::PrintAction(std::ostream& out)
    : out_(out) {
}

ActionResult PrintAction::execute(const nlohmann::json& parameters) {
    out_ << textParameter(parameters, "message", DEFAULT_MESSAGE) << std::endl;
    if (!out_) {
        return ActionResult::failure("failed to write message to output stream");
    }
    return ActionResult::ok();
}

ActionResult LogAction::execute(const nlohmann::json& parameters) {
    const std::string message = textParameter(parameters, "message", "");
    const std::string levelName = textParameter(parameters, "level", "info");

    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLogLevel(levelName, level)) {
        level = LogLevel::INFO;
    }
    Logger::log(level, message);
    return ActionResult::ok();
}

ActionResult CustomAction::execute(const nlohmann::json& parameters) {
    if (!parameters.is_object() || !parameters.contains("function") ||
        !parameters["function"].is_string()) {
        return ActionResult::failure("custom action requires a string 'function' parameter");
    }

    nlohmann::json arguments = parameters;
    const std::string function = arguments["function"].get<std::string>();
    arguments.erase("function");

    Logger::warning("Custom action '" + function + "' called with parameters: " + arguments.dump());
    return ActionResult::ok();
}

} // namespace cadence
