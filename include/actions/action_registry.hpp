#pragma once

#include "scheduler/action.hpp"
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace cadence {

// Name-to-action table used to resolve the "action" field of task configs
class ActionRegistry : public ActionResolver {
public:
    ActionRegistry() = default;

    // Registers under action->getName(), replacing an existing entry
    void registerAction(std::shared_ptr<Action> action);
    void registerAction(const std::string& name, FunctionAction::Function function);

    bool hasAction(const std::string& name) const;
    std::vector<std::string> actionNames() const;

    std::shared_ptr<Action> resolve(const std::string& name) const override;

    // Registry pre-loaded with print, log and custom. print writes to out.
    static std::shared_ptr<ActionRegistry> withBuiltins(std::ostream& out = std::cout);

private:
    std::map<std::string, std::shared_ptr<Action>> actions_;
    mutable std::mutex mutex_;
};

} // namespace cadence
