#include <gtest/gtest.h>
#include "actions/action_registry.hpp"
#include "actions/builtin_actions.hpp"
#include "common/errors.hpp"
#include <sstream>
#include <stdexcept>

using namespace cadence;

class ActionRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = ActionRegistry::withBuiltins(output_);
    }

    std::ostringstream output_;
    std::shared_ptr<ActionRegistry> registry_;
};

TEST_F(ActionRegistryTest, BuiltinsAreRegistered) {
    EXPECT_TRUE(registry_->hasAction("print"));
    EXPECT_TRUE(registry_->hasAction("log"));
    EXPECT_TRUE(registry_->hasAction("custom"));

    std::vector<std::string> expected = {"custom", "log", "print"};
    EXPECT_EQ(registry_->actionNames(), expected);
}

TEST_F(ActionRegistryTest, ResolveUnknownThrows) {
    try {
        registry_->resolve("email");
        FAIL() << "Expected UnknownAction";
    } catch (const UnknownAction& e) {
        EXPECT_EQ(e.getActionName(), "email");
    }
}

TEST_F(ActionRegistryTest, RegisterFunction) {
    int calls = 0;
    registry_->registerAction("count", [&calls](const nlohmann::json&) {
        ++calls;
        return ActionResult::ok();
    });

    auto action = registry_->resolve("count");
    EXPECT_EQ(action->getName(), "count");
    EXPECT_TRUE(action->execute(nlohmann::json::object()).success);
    EXPECT_EQ(calls, 1);
}

TEST_F(ActionRegistryTest, RegistrationReplacesExisting) {
    registry_->registerAction("print", [](const nlohmann::json&) {
        return ActionResult::failure("replaced");
    });
    EXPECT_EQ(registry_->resolve("print")->execute(nlohmann::json::object()).error, "replaced");
    EXPECT_EQ(registry_->actionNames().size(), 3u);
}

TEST_F(ActionRegistryTest, RejectsInvalidRegistrations) {
    EXPECT_THROW(registry_->registerAction(nullptr), std::invalid_argument);
    EXPECT_THROW(registry_->registerAction("", [](const nlohmann::json&) {
        return ActionResult::ok();
    }), std::invalid_argument);
}

TEST_F(ActionRegistryTest, PrintWritesMessage) {
    auto print = registry_->resolve("print");
    EXPECT_TRUE(print->execute({{"message", "backup finished"}}).success);
    EXPECT_EQ(output_.str(), "backup finished\n");
}

TEST_F(ActionRegistryTest, PrintDefaultsAndNonStringMessages) {
    auto print = registry_->resolve("print");
    print->execute(nlohmann::json::object());
    print->execute({{"message", 42}});
    EXPECT_EQ(output_.str(), std::string(PrintAction::DEFAULT_MESSAGE) + "\n42\n");
}

TEST_F(ActionRegistryTest, PrintReportsBrokenStream) {
    std::ostringstream broken;
    broken.setstate(std::ios::badbit);
    PrintAction print(broken);
    ActionResult result = print.execute({{"message", "lost"}});
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(ActionRegistryTest, LogAcceptsAnyLevel) {
    auto log = registry_->resolve("log");
    EXPECT_TRUE(log->execute({{"message", "hello"}, {"level", "warning"}}).success);
    EXPECT_TRUE(log->execute({{"message", "hello"}, {"level", "shouting"}}).success);
    EXPECT_TRUE(log->execute(nlohmann::json::object()).success);
}

TEST_F(ActionRegistryTest, CustomRequiresFunctionName) {
    auto custom = registry_->resolve("custom");
    EXPECT_TRUE(custom->execute({{"function", "rotate_logs"}, {"keep", 7}}).success);

    ActionResult missing = custom->execute({{"keep", 7}});
    EXPECT_FALSE(missing.success);
    EXPECT_NE(missing.error.find("function"), std::string::npos);

    EXPECT_FALSE(custom->execute({{"function", 12}}).success);
}

TEST(FunctionActionTest, CallbackExceptionsPropagate) {
    auto action = FunctionAction::fromCallback("explode", [](const nlohmann::json&) {
        throw std::runtime_error("kaboom");
    });
    EXPECT_THROW(action->execute(nlohmann::json::object()), std::runtime_error);
}
