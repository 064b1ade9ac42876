#include <gtest/gtest.h>
#include "background_task_manager.h"
#include "test_helpers.h"
#include <atomic>

using namespace pem;
using namespace pem::testing_support;
using State = BackgroundTaskManager::TaskStatus::State;

TEST(BackgroundTaskManagerTest, RunsTaskAndRecordsOutcome) {
    BackgroundTaskManager manager(2);
    auto ok = manager.submitTask("export", "a", [](BackgroundTaskManager::ProgressCallback progress) {
        progress(50.0, "halfway");
        return true;
    });
    auto bad = manager.submitTask("export", "b", [](BackgroundTaskManager::ProgressCallback) {
        return false;
    });
    auto thrown = manager.submitTask("export", "c", [](BackgroundTaskManager::ProgressCallback) -> bool {
        throw std::runtime_error("disk full");
    });

    ASSERT_TRUE(waitUntil([&] {
        return manager.getTaskStatus(ok).state == State::COMPLETED &&
               manager.getTaskStatus(bad).state == State::FAILED &&
               manager.getTaskStatus(thrown).state == State::FAILED;
    }));

    auto okStatus = manager.getTaskStatus(ok);
    EXPECT_DOUBLE_EQ(okStatus.progress, 100.0);
    EXPECT_EQ(okStatus.message, "halfway");
    EXPECT_EQ(okStatus.targetId, "a");
    EXPECT_EQ(manager.getTaskStatus(thrown).message, "Task failed with exception: disk full");
    EXPECT_EQ(manager.getAllTasks().size(), 3u);
}

TEST(BackgroundTaskManagerTest, UnknownTaskIsReportedAsNotFound) {
    BackgroundTaskManager manager(1);
    auto status = manager.getTaskStatus("missing");
    EXPECT_EQ(status.state, State::FAILED);
    EXPECT_EQ(status.message, "Task not found");
}

TEST(BackgroundTaskManagerTest, TasksForSameTargetNeverOverlap) {
    BackgroundTaskManager manager(4);
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};
    std::atomic<int> done{0};

    for (int i = 0; i < 4; ++i) {
        manager.submitTask("export", "same", [&](BackgroundTaskManager::ProgressCallback) {
            int now = ++running;
            int seen = maxRunning.load();
            while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            --running;
            ++done;
            return true;
        });
    }

    ASSERT_TRUE(waitUntil([&] { return done.load() == 4; }));
    EXPECT_EQ(maxRunning.load(), 1);
}

TEST(BackgroundTaskManagerTest, DifferentTargetsRunInParallel) {
    BackgroundTaskManager manager(2);
    std::atomic<int> running{0};
    std::atomic<bool> overlapped{false};
    std::atomic<int> done{0};

    for (const char* target : {"x", "y"}) {
        manager.submitTask("export", target, [&](BackgroundTaskManager::ProgressCallback) {
            if (++running == 2) {
                overlapped = true;
            }
            waitUntil([&] { return overlapped.load(); }, std::chrono::seconds(2));
            --running;
            ++done;
            return true;
        });
    }

    ASSERT_TRUE(waitUntil([&] { return done.load() == 2; }));
    EXPECT_TRUE(overlapped.load());
}

TEST(BackgroundTaskManagerTest, RejectsTasksAfterShutdown) {
    BackgroundTaskManager manager(1);
    manager.shutdown();
    EXPECT_EQ(manager.submitTask("export", "a", [](BackgroundTaskManager::ProgressCallback) { return true; }), "");
}

TEST(BackgroundTaskManagerTest, CleanupKeepsRecentTasks) {
    BackgroundTaskManager manager(1);
    auto id = manager.submitTask("export", "a", [](BackgroundTaskManager::ProgressCallback) { return true; });
    ASSERT_TRUE(waitUntil([&] { return manager.getTaskStatus(id).state == State::COMPLETED; }));

    manager.cleanupOldTasks(3600);
    EXPECT_EQ(manager.getAllTasks().size(), 1u);

    manager.cleanupOldTasks(-1);
    EXPECT_TRUE(manager.getAllTasks().empty());
}
