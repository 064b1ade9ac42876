#include "background_task_manager.h"
#include "logger.h"
#include "utils/id_utils.h"

namespace pem {

BackgroundTaskManager::BackgroundTaskManager(size_t workerCount)
    : workerCount_(workerCount == 0 ? 1 : workerCount), running_(true) {
    for (size_t i = 0; i < workerCount_; ++i) {
        workerThreads_.emplace_back(&BackgroundTaskManager::workerThread, this);
    }
    LOG_INFO("BackgroundTaskManager", "Background task manager started with " +
             std::to_string(workerCount_) + " worker(s)");
}

void BackgroundTaskManager::shutdown() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return; // Already shut down
        }
        running_ = false;

        for (const auto& task : taskQueue_) {
            auto it = taskStatuses_.find(task.id);
            if (it != taskStatuses_.end()) {
                it->second.state = TaskStatus::State::FAILED;
                it->second.message = "Dropped at shutdown";
                it->second.updatedAt = std::chrono::system_clock::now();
            }
        }
        dropped = taskQueue_.size();
        taskQueue_.clear();
    }

    cv_.notify_all();

    for (auto& worker : workerThreads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    if (dropped > 0) {
        LOG_WARN("BackgroundTaskManager", "Dropped " + std::to_string(dropped) + " queued task(s) at shutdown");
    }
    LOG_INFO("BackgroundTaskManager", "Background task manager shut down");
}

std::string BackgroundTaskManager::submitTask(std::string taskType, std::string targetId, TaskFunction taskFunc) {
    std::string taskId = utils::generateUniqueId();

    TaskStatus status;
    status.state = TaskStatus::State::PENDING;
    status.taskId = taskId;
    status.taskType = taskType;
    status.targetId = targetId;
    status.progress = 0.0;
    status.message = "Task pending";
    status.createdAt = std::chrono::system_clock::now();
    status.updatedAt = status.createdAt;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            LOG_WARN("BackgroundTaskManager", "Rejecting " + taskType + " task for " + targetId + ": shutting down");
            return "";
        }

        taskStatuses_[taskId] = status;

        Task task;
        task.id = taskId;
        task.type = std::move(taskType);
        task.targetId = std::move(targetId);
        task.func = std::move(taskFunc);
        task.createdAt = status.createdAt;

        taskQueue_.push_back(std::move(task));
    }

    cv_.notify_all();

    LOG_INFO("BackgroundTaskManager", "Task submitted: " + taskId + " [" + status.taskType + "] for " + status.targetId);

    return taskId;
}

BackgroundTaskManager::TaskStatus BackgroundTaskManager::getTaskStatus(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = taskStatuses_.find(taskId);
    if (it != taskStatuses_.end()) {
        return it->second;
    }

    TaskStatus emptyStatus;
    emptyStatus.state = TaskStatus::State::FAILED;
    emptyStatus.taskId = taskId;
    emptyStatus.progress = 0.0;
    emptyStatus.message = "Task not found";
    return emptyStatus;
}

std::vector<BackgroundTaskManager::TaskStatus> BackgroundTaskManager::getAllTasks() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<TaskStatus> tasks;
    tasks.reserve(taskStatuses_.size());
    for (const auto& pair : taskStatuses_) {
        tasks.push_back(pair.second);
    }

    return tasks;
}

void BackgroundTaskManager::cleanupOldTasks(int maxAgeSecs) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    size_t removed = 0;

    for (auto it = taskStatuses_.begin(); it != taskStatuses_.end();) {
        const auto& status = it->second;
        bool finished = status.state == TaskStatus::State::COMPLETED ||
                        status.state == TaskStatus::State::FAILED;
        auto age = std::chrono::duration_cast<std::chrono::seconds>(now - status.updatedAt).count();

        if (finished && age > maxAgeSecs) {
            it = taskStatuses_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        LOG_INFO("BackgroundTaskManager", "Cleaned up " + std::to_string(removed) + " old tasks");
    }
}

std::string BackgroundTaskManager::stateName(TaskStatus::State state) {
    switch (state) {
        case TaskStatus::State::PENDING:   return "pending";
        case TaskStatus::State::RUNNING:   return "running";
        case TaskStatus::State::COMPLETED: return "completed";
        case TaskStatus::State::FAILED:    return "failed";
        default:                           return "unknown";
    }
}

bool BackgroundTaskManager::takeRunnableTask(Task& task) {
    for (auto it = taskQueue_.begin(); it != taskQueue_.end(); ++it) {
        if (runningTargets_.count(it->targetId) > 0) {
            continue;
        }
        task = std::move(*it);
        taskQueue_.erase(it);
        runningTargets_.insert(task.targetId);

        auto& status = taskStatuses_[task.id];
        status.state = TaskStatus::State::RUNNING;
        status.message = "Task running";
        status.updatedAt = std::chrono::system_clock::now();
        return true;
    }
    return false;
}

void BackgroundTaskManager::finishTask(const Task& task, TaskStatus::State state, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        runningTargets_.erase(task.targetId);

        auto it = taskStatuses_.find(task.id);
        if (it != taskStatuses_.end()) {
            it->second.state = state;
            if (state == TaskStatus::State::COMPLETED) {
                it->second.progress = 100.0;
            }
            if (!message.empty()) {
                it->second.message = message;
            } else if (it->second.message == "Task running") {
                it->second.message = state == TaskStatus::State::COMPLETED
                                         ? "Task completed successfully"
                                         : "Task failed";
            }
            it->second.updatedAt = std::chrono::system_clock::now();
        }
    }
    // A queued task for the same target may be runnable now
    cv_.notify_all();
}

void BackgroundTaskManager::workerThread() {
    while (true) {
        Task currentTask;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this, &currentTask] {
                return !running_ || takeRunnableTask(currentTask);
            });

            if (currentTask.id.empty()) {
                break; // shutting down
            }
        }

        LOG_INFO("BackgroundTaskManager", "Starting task: " + currentTask.id + " [" + currentTask.type +
                 "] for " + currentTask.targetId);

        auto progressCallback = [this, &currentTask](double progress, std::string message) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = taskStatuses_.find(currentTask.id);
            if (it != taskStatuses_.end()) {
                it->second.progress = progress;
                it->second.message = std::move(message);
                it->second.updatedAt = std::chrono::system_clock::now();
            }
        };

        try {
            bool success = currentTask.func(progressCallback);

            // Keep the last progress message as the task's final message
            finishTask(currentTask,
                       success ? TaskStatus::State::COMPLETED : TaskStatus::State::FAILED,
                       "");

            LOG_INFO("BackgroundTaskManager", "Task " + currentTask.id + " " +
                     (success ? "completed successfully" : "failed"));
        }
        catch (const std::exception& e) {
            finishTask(currentTask, TaskStatus::State::FAILED,
                       "Task failed with exception: " + std::string(e.what()));

            LOG_ERROR("BackgroundTaskManager", "Task " + currentTask.id +
                     " failed with exception: " + e.what());
        }
    }
}

} // namespace pem
