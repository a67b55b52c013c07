#include "cli/scheduler_cli.hpp"
#include "config/document_reader.hpp"
#include "config/timing_reader.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "scheduler/scheduler.hpp"
#include <chrono>
#include <filesystem>
#include <thread>

namespace cadence {

std::atomic<bool> SchedulerCLI::shutdownRequested_(false);

SchedulerCLI::SchedulerCLI(std::shared_ptr<ActionResolver> resolver,
                           std::ostream& out,
                           std::ostream& err)
    : resolver_(std::move(resolver))
    , out_(out)
    , err_(err) {
}

int SchedulerCLI::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 0; i < argc; i++) {
        args.emplace_back(argv[i]);
    }
    return run(args);
}

int SchedulerCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        err_ << "Error: No command specified" << std::endl;
        printUsage();
        return 1;
    }

    const std::string& command = args[0];
    if (command == "-h" || command == "--help") {
        printUsage();
        return 0;
    }
    if (command == "-v" || command == "--version") {
        out_ << "cadence version " << CADENCE_VERSION << std::endl;
        return 0;
    }

    const std::vector<std::string> rest(args.begin() + 1, args.end());
    try {
        if (command == "run") {
            return handleRunCommand(rest);
        } else if (command == "list") {
            return handleListCommand(rest);
        } else if (command == "validate") {
            return handleValidateCommand(rest);
        } else if (command == "init") {
            return handleInitCommand(rest);
        } else if (command == "occurrences") {
            return handleOccurrencesCommand(rest);
        }
    } catch (const std::exception& e) {
        err_ << "Error: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error(e.what());
        }
        return 1;
    }

    err_ << "Error: Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}

void SchedulerCLI::printUsage() const {
    out_ << "Usage: cadence <command> [options]\n"
         << "Commands:\n"
         << "  run <config>          Run the tasks of a configuration until interrupted\n"
         << "      --poll-interval N   Seconds between polls (overrides the config)\n"
         << "      --log-file PATH     Also append log lines to PATH\n"
         << "      --log-level LEVEL   debug | info | warning | error | fatal\n"
         << "      --status-file PATH  Write a JSON status snapshot after every poll\n"
         << "  list <config>         Show the tasks of a configuration\n"
         << "  validate <config>     Check a configuration without running it\n"
         << "  init <path>           Write an example configuration\n"
         << "  occurrences <file>    Print the occurrences of a recurring interval document\n"
         << "      --format PATTERN    strftime pattern for the printed instants\n"
         << "\n"
         << "Options:\n"
         << "  -h, --help    Show this help message\n"
         << "  -v, --version Show version information\n";
}

int SchedulerCLI::handleRunCommand(const std::vector<std::string>& args) {
    std::string configPath;
    std::string pollInterval;
    std::string logFile;
    std::string logLevel;
    std::string statusFile;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg == "--poll-interval" && i + 1 < args.size()) {
            pollInterval = args[++i];
        } else if (arg == "--log-file" && i + 1 < args.size()) {
            logFile = args[++i];
        } else if (arg == "--log-level" && i + 1 < args.size()) {
            logLevel = args[++i];
        } else if (arg == "--status-file" && i + 1 < args.size()) {
            statusFile = args[++i];
        } else if (configPath.empty() && arg.rfind("--", 0) != 0) {
            configPath = arg;
        } else {
            err_ << "Error: Unexpected argument: " << arg << std::endl;
            return 1;
        }
    }
    if (configPath.empty()) {
        err_ << "Error: run requires a configuration file" << std::endl;
        return 1;
    }

    SchedulerConfig config = loadConfig(configPath);
    if (!pollInterval.empty()) {
        try {
            config.pollInterval = std::stoi(pollInterval);
        } catch (const std::exception&) {
            config.pollInterval = 0;
        }
        if (config.pollInterval <= 0) {
            err_ << "Error: --poll-interval must be a positive integer" << std::endl;
            return 1;
        }
    }
    if (!logFile.empty()) {
        config.logFile = logFile;
    }
    if (!logLevel.empty()) {
        config.logLevel = logLevel;
    }
    if (!statusFile.empty()) {
        config.statusFile = statusFile;
    }

    setupLogging(config.logFile, config.logLevel);

    Scheduler scheduler;
    populateScheduler(scheduler, config, *resolver_);

    if (!config.statusFile.empty()) {
        const std::string path = config.statusFile;
        scheduler.setCycleCallback([&scheduler, path](const Instant&, size_t) {
            scheduler.writeStatusFile(path);
        });
    }

    out_ << "Loaded " << scheduler.taskCount() << " task(s) from " << configPath << std::endl;
    out_ << "Press Ctrl+C to stop..." << std::endl;

    shutdownRequested_ = false;
    scheduler.start(config.pollInterval);
    while (!shutdownRequested_ && scheduler.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    Logger::info("Shutdown requested");
    scheduler.stop();

    if (!config.statusFile.empty()) {
        scheduler.writeStatusFile(config.statusFile);
    }
    printSummary(scheduler);
    return 0;
}

int SchedulerCLI::handleListCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        err_ << "Error: list requires exactly one configuration file" << std::endl;
        return 1;
    }

    const SchedulerConfig config = loadConfig(args[0]);
    Scheduler scheduler;
    populateScheduler(scheduler, config, *resolver_);

    const auto tasks = scheduler.listTasks();
    if (tasks.empty()) {
        out_ << "No tasks configured" << std::endl;
        return 0;
    }
    for (const auto& info : tasks) {
        out_ << formatTaskInfo(info) << "\n\n";
    }
    out_ << tasks.size() << " task(s)" << std::endl;
    return 0;
}

int SchedulerCLI::handleValidateCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        err_ << "Error: validate requires exactly one configuration file" << std::endl;
        return 1;
    }

    try {
        const SchedulerConfig config = loadConfig(args[0]);
        Scheduler scheduler;
        populateScheduler(scheduler, config, *resolver_);
        out_ << "Configuration OK: " << scheduler.taskCount() << " task(s)" << std::endl;
        return 0;
    } catch (const CadenceError& e) {
        err_ << "Configuration invalid: " << e.what() << std::endl;
        return 1;
    }
}

int SchedulerCLI::handleInitCommand(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        err_ << "Error: init requires an output path" << std::endl;
        return 1;
    }
    if (std::filesystem::exists(args[0])) {
        err_ << "Error: Refusing to overwrite existing file: " << args[0] << std::endl;
        return 1;
    }

    saveConfig(defaultConfig(), args[0]);
    out_ << "Wrote example configuration to " << args[0] << std::endl;
    return 0;
}

int SchedulerCLI::handleOccurrencesCommand(const std::vector<std::string>& args) {
    std::string path;
    std::string format = DEFAULT_INSTANT_FORMAT;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--format" && i + 1 < args.size()) {
            format = args[++i];
        } else if (path.empty()) {
            path = args[i];
        } else {
            err_ << "Error: Unexpected argument: " << args[i] << std::endl;
            return 1;
        }
    }
    if (path.empty()) {
        err_ << "Error: occurrences requires a document path" << std::endl;
        return 1;
    }

    const RecurringInterval recurring = recurringFromDocument(DocumentReader::fromFile(path));
    const auto occurrences = recurring.occurrences();
    for (size_t i = 0; i < occurrences.size(); i++) {
        out_ << (i + 1) << ": " << occurrences[i].toString(format) << "\n";
    }
    out_ << occurrences.size() << " occurrence(s)" << std::endl;
    return 0;
}

void SchedulerCLI::setupLogging(const std::string& logFile, const std::string& logLevel) const {
    LogLevel level = LogLevel::INFO;
    if (!Logger::parseLogLevel(logLevel, level)) {
        throw ConfigError("Unknown log level: " + logLevel);
    }
    if (Logger::isInitialized()) {
        Logger::setLogLevel(level);
        return;
    }
    if (!Logger::initialize(logFile, level)) {
        throw ConfigError("Failed to initialize logger with file: " + logFile);
    }
}

void SchedulerCLI::printSummary(const Scheduler& scheduler) const {
    out_ << "\nTask execution summary:" << std::endl;
    for (const auto& info : scheduler.listTasks()) {
        out_ << "  - " << info.name << ": " << info.runCount << " execution(s)";
        if (info.failureCount > 0) {
            out_ << ", " << info.failureCount << " failure(s)";
        }
        out_ << std::endl;
    }
}

} // namespace cadence
