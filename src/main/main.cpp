#include "actions/action_registry.hpp"
#include "cli/scheduler_cli.hpp"
#include "common/logger.hpp"
#include <csignal>
#include <iostream>
#include <string>

namespace {

void handleSignal(int) {
    cadence::SchedulerCLI::requestShutdown();
}

} // namespace

int main(int argc, char** argv) {
    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    try {
        cadence::SchedulerCLI cli(cadence::ActionRegistry::withBuiltins(std::cout));
        int result = cli.run(argc - 1, argv + 1);
        cadence::Logger::shutdown();
        return result;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (cadence::Logger::isInitialized()) {
            cadence::Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
