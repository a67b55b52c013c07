#pragma once

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace cadence {

struct ActionResult {
    bool success;
    std::string error;

    static ActionResult ok() { return ActionResult{true, ""}; }
    static ActionResult failure(const std::string& error) { return ActionResult{false, error}; }
};

// Work a task performs when it fires. Implementations may throw; the
// scheduler treats a thrown exception like a failed result.
class Action {
public:
    virtual ~Action() = default;

    virtual std::string getName() const = 0;
    virtual ActionResult execute(const nlohmann::json& parameters) = 0;
};

// Wraps a callable as an Action
class FunctionAction : public Action {
public:
    using Function = std::function<ActionResult(const nlohmann::json&)>;
    using Callback = std::function<void(const nlohmann::json&)>;

    FunctionAction(const std::string& name, Function function)
        : name_(name)
        , function_(std::move(function)) {}

    // Success unless the callback throws
    static std::shared_ptr<FunctionAction> fromCallback(const std::string& name, Callback callback) {
        return std::make_shared<FunctionAction>(name,
            [callback](const nlohmann::json& parameters) {
                callback(parameters);
                return ActionResult::ok();
            });
    }

    std::string getName() const override { return name_; }
    ActionResult execute(const nlohmann::json& parameters) override { return function_(parameters); }

private:
    std::string name_;
    Function function_;
};

// Maps action names found in configuration to capabilities
class ActionResolver {
public:
    virtual ~ActionResolver() = default;

    // Throws UnknownAction for names it cannot resolve
    virtual std::shared_ptr<Action> resolve(const std::string& name) const = 0;
};

} // namespace cadence
