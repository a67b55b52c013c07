#include <gtest/gtest.h>
#include "cli/scheduler_cli.hpp"
#include "actions/action_registry.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace cadence;

class SchedulerCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "cadence_cli_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);

        registry_ = ActionRegistry::withBuiltins(actionOutput_);
        registry_->registerAction("shutdown", [](const nlohmann::json&) {
            SchedulerCLI::requestShutdown();
            return ActionResult::ok();
        });
        cli_ = std::make_unique<SchedulerCLI>(registry_, out_, err_);
    }

    void TearDown() override {
        Logger::shutdown();
        std::filesystem::remove_all(tempDir_);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const std::string path = (tempDir_ / name).string();
        std::ofstream file(path);
        file << content;
        return path;
    }

    int run(const std::vector<std::string>& args) {
        return cli_->run(args);
    }

    std::filesystem::path tempDir_;
    std::ostringstream out_;
    std::ostringstream err_;
    std::ostringstream actionOutput_;
    std::shared_ptr<ActionRegistry> registry_;
    std::unique_ptr<SchedulerCLI> cli_;
};

TEST_F(SchedulerCLITest, Version) {
    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_EQ(out_.str(), "cadence version 1.0.0\n");
}

TEST_F(SchedulerCLITest, Help) {
    EXPECT_EQ(run({"-h"}), 0);
    EXPECT_NE(out_.str().find("Usage: cadence"), std::string::npos);
}

TEST_F(SchedulerCLITest, NoCommand) {
    EXPECT_EQ(run({}), 1);
    EXPECT_NE(err_.str().find("No command specified"), std::string::npos);
}

TEST_F(SchedulerCLITest, UnknownCommand) {
    EXPECT_EQ(run({"explode"}), 1);
    EXPECT_NE(err_.str().find("Unknown command: explode"), std::string::npos);
}

TEST_F(SchedulerCLITest, InitWritesLoadableConfig) {
    const std::string path = (tempDir_ / "generated.yaml").string();
    EXPECT_EQ(run({"init", path}), 0);
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_NE(out_.str().find("Wrote example configuration"), std::string::npos);

    SchedulerConfig config = loadConfig(path);
    ASSERT_EQ(config.tasks.size(), 1u);
    EXPECT_EQ(config.tasks[0].name, "example_task");

    // A second init must not clobber the file
    EXPECT_EQ(run({"init", path}), 1);
    EXPECT_NE(err_.str().find("Refusing to overwrite"), std::string::npos);
}

TEST_F(SchedulerCLITest, ValidateAcceptsGoodConfig) {
    const std::string path = writeFile("good.yaml",
        "tasks:\n"
        "  - name: greet\n"
        "    schedule: every 10 seconds\n"
        "    action: print\n"
        "  - name: audit\n"
        "    schedule: every day at 02:00\n"
        "    action: log\n");
    EXPECT_EQ(run({"validate", path}), 0);
    EXPECT_EQ(out_.str(), "Configuration OK: 2 task(s)\n");
}

TEST_F(SchedulerCLITest, ValidateReportsProblems) {
    const std::string badSchedule = writeFile("bad_schedule.yaml",
        "tasks:\n"
        "  - name: greet\n"
        "    schedule: every blue moon\n"
        "    action: print\n");
    EXPECT_EQ(run({"validate", badSchedule}), 1);
    EXPECT_NE(err_.str().find("tasks[0].schedule"), std::string::npos);

    const std::string badAction = writeFile("bad_action.yaml",
        "tasks:\n"
        "  - name: greet\n"
        "    schedule: every hour\n"
        "    action: email\n");
    EXPECT_EQ(run({"validate", badAction}), 1);
    EXPECT_NE(err_.str().find("Unknown action: email"), std::string::npos);

    EXPECT_EQ(run({"validate", (tempDir_ / "absent.yaml").string()}), 1);
    EXPECT_EQ(run({"validate"}), 1);
}

TEST_F(SchedulerCLITest, ListShowsTasks) {
    const std::string path = writeFile("list.yaml",
        "tasks:\n"
        "  - name: greet\n"
        "    description: Say hello\n"
        "    schedule: every 10 seconds\n"
        "    action: print\n"
        "  - name: audit\n"
        "    schedule: every monday at 02:00\n"
        "    action: log\n"
        "    enabled: false\n");
    EXPECT_EQ(run({"list", path}), 0);

    const std::string output = out_.str();
    EXPECT_NE(output.find("Task: greet"), std::string::npos);
    EXPECT_NE(output.find("  Description: Say hello"), std::string::npos);
    EXPECT_NE(output.find("  Schedule: every 10 seconds"), std::string::npos);
    EXPECT_NE(output.find("Task: audit"), std::string::npos);
    EXPECT_NE(output.find("  Status: Disabled"), std::string::npos);
    EXPECT_NE(output.find("2 task(s)"), std::string::npos);
}

TEST_F(SchedulerCLITest, ListEmptyConfig) {
    const std::string path = writeFile("empty.yaml", "tasks: []\n");
    EXPECT_EQ(run({"list", path}), 0);
    EXPECT_EQ(out_.str(), "No tasks configured\n");
}

TEST_F(SchedulerCLITest, Occurrences) {
    const std::string path = writeFile("recurring.yaml",
        "first:\n"
        "  start: {datetime: \"2025-01-01 09:00:00\"}\n"
        "  end: {datetime: \"2025-01-01 10:00:00\"}\n"
        "until:\n"
        "  start: {datetime: \"2025-01-03 09:00:00\"}\n"
        "  duration: 3600\n"
        "every: {datetime: \"1970-01-02 00:00:00\"}\n");
    EXPECT_EQ(run({"occurrences", path, "--format", "%m/%d %H:%M"}), 0);
    EXPECT_EQ(out_.str(),
              "1: 01/01 09:00 - 01/01 10:00\n"
              "2: 01/02 09:00 - 01/02 10:00\n"
              "3: 01/03 09:00 - 01/03 10:00\n"
              "3 occurrence(s)\n");
}

TEST_F(SchedulerCLITest, OccurrencesRejectsBadDocument) {
    const std::string path = writeFile("broken.yaml", "first: {}\n");
    EXPECT_EQ(run({"occurrences", path}), 1);
    EXPECT_NE(err_.str().find("Error:"), std::string::npos);
}

TEST_F(SchedulerCLITest, RunUntilShutdown) {
    const std::string statusPath = (tempDir_ / "status.json").string();
    const std::string path = writeFile("run.yaml",
        "scheduler:\n"
        "  log_level: error\n"
        "tasks:\n"
        "  - name: greet\n"
        "    schedule: every 1 hour\n"
        "    action: print\n"
        "    parameters: {message: tick}\n"
        "  - name: stop\n"
        "    schedule: every 1 hour\n"
        "    action: shutdown\n");

    EXPECT_EQ(run({"run", path, "--status-file", statusPath}), 0);
    EXPECT_EQ(actionOutput_.str(), "tick\n");
    EXPECT_NE(out_.str().find("Task execution summary:"), std::string::npos);
    EXPECT_NE(out_.str().find("  - greet: 1 execution(s)"), std::string::npos);

    std::ifstream file(statusPath);
    ASSERT_TRUE(file.is_open());
    nlohmann::json status = nlohmann::json::parse(file);
    EXPECT_EQ(status["task_count"], 2);
    EXPECT_FALSE(status["running"].get<bool>());
}

TEST_F(SchedulerCLITest, RunRejectsBadArguments) {
    EXPECT_EQ(run({"run"}), 1);
    const std::string path = writeFile("run.yaml", "tasks: []\n");
    EXPECT_EQ(run({"run", path, "--poll-interval", "zero"}), 1);
    EXPECT_EQ(run({"run", path, "--bogus"}), 1);
}
