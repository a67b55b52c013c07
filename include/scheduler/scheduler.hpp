#pragma once

#include "scheduler/action.hpp"
#include "scheduler/task.hpp"
#include "scheduler/trigger.hpp"
#include "timing/instant.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace cadence {

// Owns a table of named tasks and runs the ones whose trigger is due.
//
// Polling is cooperative: pollOnce() snapshots the due tasks under the lock
// and then runs their actions one after another outside of it. Action
// failures are recorded on the task and never escape pollOnce().
class Scheduler {
public:
    using CycleCallback = std::function<void(const Instant& now, size_t executed)>;

    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Task registry
    void addTask(const TaskDefinition& definition);
    void removeTask(const std::string& name);
    void enableTask(const std::string& name);
    void disableTask(const std::string& name);
    TaskInfo getTask(const std::string& name) const;
    std::vector<TaskInfo> listTasks() const;
    bool hasTask(const std::string& name) const;
    size_t taskCount() const;
    void clear();

    // Runs every due task once and returns how many actions were executed
    size_t pollOnce(const Instant& now);

    // Executes a task regardless of its trigger. Returns false for a disabled
    // task or when called from inside a running action, and throws
    // ActionExecutionFailure when the action fails. Waits for an action
    // running on another thread to finish first.
    bool runTaskNow(const std::string& name);
    bool runTaskNow(const std::string& name, const Instant& now);

    // Blocks polling every pollIntervalSeconds until stop() is called
    void run(int pollIntervalSeconds = 1);
    // Same loop on a background thread
    bool start(int pollIntervalSeconds = 1);
    void stop();
    bool isRunning() const { return running_; }

    void setCycleCallback(CycleCallback callback);

    nlohmann::json toJson() const;
    bool writeStatusFile(const std::string& path) const;

private:
    struct TaskEntry {
        TaskDefinition definition;
        std::unique_ptr<Trigger> trigger;
        uint64_t runCount = 0;
        uint64_t failureCount = 0;
        std::optional<Instant> lastRun;
        std::optional<Instant> nextRun;
        std::optional<std::string> lastError;
    };

    std::shared_ptr<TaskEntry> findTask(const std::string& name) const;
    TaskInfo snapshot(const TaskEntry& entry) const;
    ActionResult execute(TaskEntry& entry, const Instant& now);
    void refreshNextRun(TaskEntry& entry, const Instant& now);
    void runLoop(int pollIntervalSeconds);
    bool beginRunning();
    bool isExecutingOnThisThread() const;

    std::map<std::string, std::shared_ptr<TaskEntry>> tasks_;
    mutable std::mutex mutex_;

    CycleCallback cycleCallback_;

    std::atomic<bool> running_;
    std::atomic<bool> stopRequested_;
    std::atomic<bool> polling_;
    // Held while an action runs; at most one action is in flight
    std::mutex executionMutex_;
    std::atomic<std::thread::id> executingThread_;
    std::mutex waitMutex_;
    std::condition_variable condition_;
    std::thread schedulerThread_;
};

} // namespace cadence
