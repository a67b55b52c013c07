#include "scheduler/scheduler.hpp"
#include "scheduler/schedule_parser.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace cadence {

namespace {

// Clears the polling flag when a poll cycle ends, however it ends
class PollGuard {
public:
    explicit PollGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~PollGuard() { flag_ = false; }

private:
    std::atomic<bool>& flag_;
};

// Marks the calling thread as the one running an action
class ExecutionGuard {
public:
    explicit ExecutionGuard(std::atomic<std::thread::id>& owner) : owner_(owner) {
        owner_ = std::this_thread::get_id();
    }
    ~ExecutionGuard() { owner_ = std::thread::id(); }

private:
    std::atomic<std::thread::id>& owner_;
};

} // namespace

Scheduler::Scheduler()
    : running_(false)
    , stopRequested_(false)
    , polling_(false)
    , executingThread_(std::thread::id()) {
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::addTask(const TaskDefinition& definition) {
    if (definition.name.empty()) {
        throw std::invalid_argument("Task name cannot be empty");
    }
    if (!definition.action) {
        throw std::invalid_argument("Task '" + definition.name + "' has no action");
    }

    // Parse before touching the table so a bad schedule leaves nothing behind
    auto entry = std::make_shared<TaskEntry>();
    entry->definition = definition;
    if (entry->definition.parameters.is_null()) {
        entry->definition.parameters = nlohmann::json::object();
    }
    entry->trigger = parseSchedule(definition.schedule);
    refreshNextRun(*entry, Instant::now());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.find(definition.name) != tasks_.end()) {
            throw DuplicateTaskName(definition.name);
        }
        tasks_[definition.name] = entry;
    }
    Logger::info("Added task: " + definition.name + " (" + entry->trigger->describe() + ")");
}

void Scheduler::removeTask(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(name);
        if (it == tasks_.end()) {
            throw TaskNotFound(name);
        }
        tasks_.erase(it);
    }
    Logger::info("Removed task: " + name);
}

void Scheduler::enableTask(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(name);
        if (it == tasks_.end()) {
            throw TaskNotFound(name);
        }
        it->second->definition.enabled = true;
    }
    Logger::info("Enabled task: " + name);
}

void Scheduler::disableTask(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(name);
        if (it == tasks_.end()) {
            throw TaskNotFound(name);
        }
        it->second->definition.enabled = false;
    }
    Logger::info("Disabled task: " + name);
}

TaskInfo Scheduler::getTask(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        throw TaskNotFound(name);
    }
    return snapshot(*it->second);
}

std::vector<TaskInfo> Scheduler::listTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskInfo> result;
    result.reserve(tasks_.size());
    for (const auto& pair : tasks_) {
        result.push_back(snapshot(*pair.second));
    }
    return result;
}

bool Scheduler::hasTask(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.find(name) != tasks_.end();
}

size_t Scheduler::taskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void Scheduler::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.clear();
    }
    Logger::info("All tasks cleared");
}

size_t Scheduler::pollOnce(const Instant& now) {
    if (isExecutingOnThisThread()) {
        Logger::warning("Poll requested from inside a running action, ignoring");
        return 0;
    }
    bool expected = false;
    if (!polling_.compare_exchange_strong(expected, true)) {
        Logger::warning("Poll cycle already in progress, ignoring nested poll request");
        return 0;
    }
    PollGuard guard(polling_);

    std::vector<std::shared_ptr<TaskEntry>> due;
    CycleCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& pair : tasks_) {
            const auto& entry = pair.second;
            if (!entry->definition.enabled) {
                continue;
            }
            try {
                if (entry->trigger->isDue(now, entry->lastRun)) {
                    due.push_back(entry);
                }
            } catch (const std::exception& e) {
                Logger::error("Cannot evaluate schedule of task '" + pair.first + "': " + e.what());
            }
        }
        callback = cycleCallback_;
    }

    for (const auto& entry : due) {
        execute(*entry, now);
    }

    if (callback) {
        try {
            callback(now, due.size());
        } catch (const std::exception& e) {
            Logger::error("Cycle callback failed: " + std::string(e.what()));
        }
    }
    return due.size();
}

bool Scheduler::runTaskNow(const std::string& name) {
    return runTaskNow(name, Instant::now());
}

bool Scheduler::runTaskNow(const std::string& name, const Instant& now) {
    auto entry = findTask(name);
    if (isExecutingOnThisThread()) {
        Logger::warning("Task '" + name + "' requested from inside a running action, skipping execution");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!entry->definition.enabled) {
            Logger::warning("Task '" + name + "' is disabled, skipping execution");
            return false;
        }
    }

    ActionResult result = execute(*entry, now);
    if (!result.success) {
        throw ActionExecutionFailure(name, result.error);
    }
    return true;
}

void Scheduler::run(int pollIntervalSeconds) {
    if (pollIntervalSeconds <= 0) {
        throw std::invalid_argument("Poll interval must be positive");
    }
    if (!beginRunning()) {
        Logger::warning("Scheduler is already running");
        return;
    }
    runLoop(pollIntervalSeconds);
}

bool Scheduler::start(int pollIntervalSeconds) {
    if (pollIntervalSeconds <= 0) {
        throw std::invalid_argument("Poll interval must be positive");
    }
    if (!beginRunning()) {
        Logger::warning("Scheduler is already running");
        return false;
    }
    // A loop stopped from inside an action leaves its thread to be joined here
    if (schedulerThread_.joinable()) {
        schedulerThread_.join();
    }
    schedulerThread_ = std::thread(&Scheduler::runLoop, this, pollIntervalSeconds);
    return true;
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        if (running_) {
            stopRequested_ = true;
        }
    }
    condition_.notify_all();

    if (schedulerThread_.joinable() && schedulerThread_.get_id() != std::this_thread::get_id()) {
        schedulerThread_.join();
    }
}

void Scheduler::setCycleCallback(CycleCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    cycleCallback_ = std::move(callback);
}

nlohmann::json Scheduler::toJson() const {
    nlohmann::json status;
    status["running"] = running_.load();

    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& info : listTasks()) {
        tasks.push_back(taskInfoToJson(info));
    }
    status["task_count"] = tasks.size();
    status["tasks"] = tasks;
    return status;
}

bool Scheduler::writeStatusFile(const std::string& path) const {
    try {
        const std::filesystem::path statusPath(path);
        if (statusPath.has_parent_path()) {
            std::filesystem::create_directories(statusPath.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            Logger::error("Failed to open status file for writing: " + path);
            return false;
        }
        file << toJson().dump(4);
        return true;
    } catch (const std::exception& e) {
        Logger::error("Failed to write status file: " + std::string(e.what()));
        return false;
    }
}

std::shared_ptr<Scheduler::TaskEntry> Scheduler::findTask(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        throw TaskNotFound(name);
    }
    return it->second;
}

TaskInfo Scheduler::snapshot(const TaskEntry& entry) const {
    TaskInfo info;
    info.name = entry.definition.name;
    info.schedule = entry.definition.schedule;
    info.description = entry.definition.description;
    info.actionName = entry.definition.action->getName();
    info.enabled = entry.definition.enabled;
    info.parameters = entry.definition.parameters;
    info.runCount = entry.runCount;
    info.failureCount = entry.failureCount;
    info.lastRun = entry.lastRun;
    info.nextRun = entry.nextRun;
    info.lastError = entry.lastError;
    return info;
}

ActionResult Scheduler::execute(TaskEntry& entry, const Instant& now) {
    const std::string& name = entry.definition.name;
    Logger::info("Executing task: " + name);

    ActionResult result{false, ""};
    {
        std::lock_guard<std::mutex> executionLock(executionMutex_);
        ExecutionGuard guard(executingThread_);
        try {
            result = entry.definition.action->execute(entry.definition.parameters);
        } catch (const std::exception& e) {
            result = ActionResult::failure(e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.runCount++;
        entry.lastRun = now;
        if (result.success) {
            entry.lastError.reset();
        } else {
            entry.failureCount++;
            entry.lastError = result.error;
        }
        refreshNextRun(entry, now);
    }

    if (result.success) {
        Logger::info("Task '" + name + "' completed successfully");
    } else {
        Logger::error(ActionExecutionFailure(name, result.error).what());
    }
    return result;
}

void Scheduler::refreshNextRun(TaskEntry& entry, const Instant& now) {
    try {
        entry.nextRun = entry.trigger->nextFire(now, entry.lastRun);
    } catch (const std::exception& e) {
        entry.nextRun.reset();
        Logger::debug("No next run for task '" + entry.definition.name + "': " + e.what());
    }
}

void Scheduler::runLoop(int pollIntervalSeconds) {
    Logger::info("Scheduler started, polling every " + std::to_string(pollIntervalSeconds) + "s");

    while (!stopRequested_) {
        try {
            pollOnce(Instant::now());
        } catch (const std::exception& e) {
            Logger::error("Poll cycle failed: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(waitMutex_);
        condition_.wait_for(lock, std::chrono::seconds(pollIntervalSeconds),
                            [this] { return stopRequested_.load(); });
    }

    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        running_ = false;
        stopRequested_ = false;
    }
    Logger::info("Scheduler stopped");
}

// Claims the running state; a stop() racing with this either sees the
// scheduler idle or lands after the reset
bool Scheduler::beginRunning() {
    std::lock_guard<std::mutex> lock(waitMutex_);
    if (running_) {
        return false;
    }
    running_ = true;
    stopRequested_ = false;
    return true;
}

bool Scheduler::isExecutingOnThisThread() const {
    return executingThread_.load() == std::this_thread::get_id();
}

} // namespace cadence
