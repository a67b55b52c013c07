#pragma once

#include "scheduler/action.hpp"
#include "config/scheduler_config.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace cadence {

constexpr char CADENCE_VERSION[] = "1.0.0";

class SchedulerCLI {
public:
    explicit SchedulerCLI(std::shared_ptr<ActionResolver> resolver,
                          std::ostream& out = std::cout,
                          std::ostream& err = std::cerr);

    // argv[0] is the command name. Returns the process exit code.
    int run(int argc, char* argv[]);
    int run(const std::vector<std::string>& args);
    void printUsage() const;

    // Safe to call from a signal handler
    static void requestShutdown() { shutdownRequested_ = true; }
    static bool isShutdownRequested() { return shutdownRequested_; }

private:
    int handleRunCommand(const std::vector<std::string>& args);
    int handleListCommand(const std::vector<std::string>& args);
    int handleValidateCommand(const std::vector<std::string>& args);
    int handleInitCommand(const std::vector<std::string>& args);
    int handleOccurrencesCommand(const std::vector<std::string>& args);

    void setupLogging(const std::string& logFile, const std::string& logLevel) const;
    void printSummary(const Scheduler& scheduler) const;

    std::shared_ptr<ActionResolver> resolver_;
    std::ostream& out_;
    std::ostream& err_;

    static std::atomic<bool> shutdownRequested_;
};

} // namespace cadence
