#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pem {

/**
 * @brief Worker pool for long-running export pipelines
 *
 * Tasks carry a target id (the event identifier). A worker only takes a
 * task whose target is not already running, so tasks of one target run in
 * submission order while different targets run in parallel.
 */
class BackgroundTaskManager {
public:
    struct TaskStatus {
        enum class State {
            PENDING,
            RUNNING,
            COMPLETED,
            FAILED
        };

        State state;
        std::string taskId;
        std::string taskType;
        std::string targetId;
        double progress;
        std::string message;
        std::chrono::system_clock::time_point createdAt;
        std::chrono::system_clock::time_point updatedAt;
    };

    using ProgressCallback = std::function<void(double, std::string)>;
    using TaskFunction = std::function<bool(ProgressCallback)>;

    /**
     * @brief Start the worker threads
     *
     * @param workerCount Number of tasks that may run at the same time
     */
    explicit BackgroundTaskManager(size_t workerCount = 4);

    BackgroundTaskManager(const BackgroundTaskManager&) = delete;
    BackgroundTaskManager& operator=(const BackgroundTaskManager&) = delete;

    ~BackgroundTaskManager() {
        shutdown();
    }

    /**
     * @brief Queue a task
     *
     * @param taskType Short label such as "export"
     * @param targetId Serialization key; tasks with the same key never overlap
     * @param taskFunc Work to run; returns success and may report progress
     * @return std::string Generated task id, empty if the manager is shut down
     */
    std::string submitTask(std::string taskType, std::string targetId, TaskFunction taskFunc);

    /**
     * @brief Status of a task
     *
     * @return TaskStatus A FAILED status with message "Task not found" for unknown ids
     */
    TaskStatus getTaskStatus(const std::string& taskId);

    std::vector<TaskStatus> getAllTasks();

    // Clean up finished tasks older than the given age
    void cleanupOldTasks(int maxAgeSecs = 3600);

    size_t workerCount() const { return workerCount_; }

    // Waits for running tasks; queued tasks are dropped
    void shutdown();

    static std::string stateName(TaskStatus::State state);

private:
    struct Task {
        std::string id;
        std::string type;
        std::string targetId;
        TaskFunction func;
        std::chrono::system_clock::time_point createdAt;
    };

    void workerThread();

    // Caller holds mutex_
    bool takeRunnableTask(Task& task);
    void finishTask(const Task& task, TaskStatus::State state, const std::string& message);

    size_t workerCount_;
    std::unordered_map<std::string, TaskStatus> taskStatuses_;
    std::deque<Task> taskQueue_;
    std::unordered_set<std::string> runningTargets_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workerThreads_;
    std::atomic<bool> running_;
};

} // namespace pem
