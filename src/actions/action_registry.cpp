#include "actions/action_registry.hpp"
#include "actions/builtin_actions.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <stdexcept>

namespace cadence {

void ActionRegistry::registerAction(std::shared_ptr<Action> action) {
    if (!action) {
        throw std::invalid_argument("Cannot register a null action");
    }
    const std::string name = action->getName();
    if (name.empty()) {
        throw std::invalid_argument("Action name cannot be empty");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        actions_[name] = std::move(action);
    }
    Logger::debug("Registered action: " + name);
}

void ActionRegistry::registerAction(const std::string& name, FunctionAction::Function function) {
    registerAction(std::make_shared<FunctionAction>(name, std::move(function)));
}

bool ActionRegistry::hasAction(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.find(name) != actions_.end();
}

std::vector<std::string> ActionRegistry::actionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& pair : actions_) {
        names.push_back(pair.first);
    }
    return names;
}

std::shared_ptr<Action> ActionRegistry::resolve(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = actions_.find(name);
    if (it == actions_.end()) {
        throw UnknownAction(name);
    }
    return it->second;
}

std::shared_ptr<ActionRegistry> ActionRegistry::withBuiltins(std::ostream& out) {
    auto registry = std::make_shared<ActionRegistry>();
    registry->registerAction(std::make_shared<PrintAction>(out));
    registry->registerAction(std::make_shared<LogAction>());
    registry->registerAction(std::make_shared<CustomAction>());
    return registry;
}

} // namespace cadence
