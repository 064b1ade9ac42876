#include <gtest/gtest.h>
#include "errors.h"
#include "events/event_manager.h"
#include "test_helpers.h"
#include <filesystem>
#include <unistd.h>

using namespace pem;
using namespace pem::testing_support;
using namespace std::chrono;
namespace fs = std::filesystem;

class EventManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() / ("pem_manager_" + std::to_string(::getpid()));
        exporter_ = std::make_shared<FakeExporter>();
    }

    void TearDown() override {
        manager_.reset();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void startManager(int maxAttempts = 3) {
        RetryPolicy policy(maxAttempts, milliseconds(0), [](milliseconds) { return true; });
        auto pipeline = std::make_shared<ExportPipeline>(exporter_, policy, nullptr, root_.string());
        EventDefaults defaults;
        defaults.pastMinutes = 1.0;
        defaults.futureMinutes = 0.005;   // 300 ms
        manager_ = std::make_unique<EventManager>(pipeline, defaults, 2);
        manager_->start();
    }

    static StartRequest request(const std::string& id, std::optional<double> future = std::nullopt) {
        StartRequest r;
        r.identifier = id;
        r.futureMinutes = future;
        return r;
    }

    fs::path root_;
    std::shared_ptr<FakeExporter> exporter_;
    std::unique_ptr<EventManager> manager_;
};

TEST_F(EventManagerTest, ExportsWhenWindowEndsAndRemovesEvent) {
    startManager();
    auto result = manager_->startOrExtend(request("porch"));
    EXPECT_TRUE(result.created);
    EXPECT_EQ(result.message, "New event porch started");

    ASSERT_TRUE(waitUntil([this] { return exporter_->callCount() == 1; }));
    ASSERT_TRUE(waitUntil([this] { return !manager_->status("porch").has_value(); }));

    auto exported = exporter_->requests().front();
    EXPECT_EQ(exported.identifier, "porch");
    EXPECT_EQ(exported.startTime, result.event.startTime);
    EXPECT_EQ(exported.endTime, result.event.endTime);
    EXPECT_EQ(exported.outputFolder, (root_ / "porch").string());

    auto tasks = manager_->tasks().getAllTasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_TRUE(waitUntil([this] {
        return manager_->tasks().getAllTasks().front().state == BackgroundTaskManager::TaskStatus::State::COMPLETED;
    }));
}

TEST_F(EventManagerTest, CancelBeforeWindowEndsPreventsExport) {
    startManager();
    manager_->startOrExtend(request("porch", 0.01));
    EXPECT_TRUE(manager_->cancel("porch"));
    EXPECT_FALSE(manager_->status("porch").has_value());

    std::this_thread::sleep_for(milliseconds(900));
    EXPECT_EQ(exporter_->callCount(), 0u);
    EXPECT_FALSE(manager_->cancel("porch"));
}

TEST_F(EventManagerTest, ExtendPostponesExport) {
    startManager();
    manager_->startOrExtend(request("porch", 0.01));       // ends in 600 ms
    std::this_thread::sleep_for(milliseconds(300));
    auto extended = manager_->startOrExtend(request("porch", 0.02));   // ends 1200 ms from now
    EXPECT_FALSE(extended.created);
    EXPECT_EQ(extended.message, "Event porch extended");

    std::this_thread::sleep_for(milliseconds(600));
    EXPECT_EQ(exporter_->callCount(), 0u);
    ASSERT_TRUE(manager_->status("porch").has_value());

    ASSERT_TRUE(waitUntil([this] { return exporter_->callCount() == 1; }));
    std::this_thread::sleep_for(milliseconds(200));
    EXPECT_EQ(exporter_->callCount(), 1u);
}

TEST_F(EventManagerTest, RemainingTimeDecreases) {
    startManager();
    manager_->startOrExtend(request("porch", 1.0));

    auto first = manager_->status("porch");
    ASSERT_TRUE(first.has_value());
    double before = first->remainingSeconds(system_clock::now());

    std::this_thread::sleep_for(milliseconds(200));
    auto second = manager_->status("porch");
    ASSERT_TRUE(second.has_value());
    double after = second->remainingSeconds(system_clock::now());

    EXPECT_LE(before, 60.0);
    EXPECT_LT(after, before);
    EXPECT_GT(after, 0.0);
    EXPECT_EQ(second->status, EventStatus::PENDING);
    EXPECT_TRUE(manager_->cancel("porch"));
}

TEST_F(EventManagerTest, GeneratesIdentifierWhenMissing) {
    startManager();
    auto result = manager_->startOrExtend(request("", 1.0));
    EXPECT_EQ(result.event.identifier.size(), 36u);
    EXPECT_TRUE(manager_->status(result.event.identifier).has_value());
    EXPECT_EQ(manager_->statusAll().size(), 1u);
}

TEST_F(EventManagerTest, FailedExportStillRemovesEvent) {
    exporter_ = std::make_shared<FakeExporter>(100);
    startManager(2);
    manager_->startOrExtend(request("porch"));

    ASSERT_TRUE(waitUntil([this] { return exporter_->callCount() == 2; }));
    ASSERT_TRUE(waitUntil([this] { return !manager_->status("porch").has_value(); }));
    EXPECT_TRUE(waitUntil([this] {
        auto tasks = manager_->tasks().getAllTasks();
        return tasks.size() == 1 && tasks.front().state == BackgroundTaskManager::TaskStatus::State::FAILED;
    }));
}

TEST_F(EventManagerTest, RejectsInvalidInput) {
    startManager();
    EXPECT_THROW(manager_->cancel(""), ValidationError);
    EXPECT_THROW(manager_->startOrExtend(request("bad id")), ValidationError);
    EXPECT_THROW(manager_->startOrExtend(request("porch", -1.0)), ValidationError);
    EXPECT_THROW(manager_->cancel("../x"), ValidationError);
    EXPECT_TRUE(manager_->statusAll().empty());
}

TEST_F(EventManagerTest, RejectsWindowsBeyondOneHundredYears) {
    startManager();
    EXPECT_THROW(manager_->startOrExtend(request("porch", 1e300)), ValidationError);

    StartRequest past = request("porch");
    past.pastMinutes = 2e13;
    EXPECT_THROW(manager_->startOrExtend(past), ValidationError);
    EXPECT_TRUE(manager_->statusAll().empty());

    // A long but representable window stays scheduled in the future
    auto before = system_clock::now();
    auto result = manager_->startOrExtend(request("porch", 525600.0));
    EXPECT_GT(result.event.endTime, before + hours(24 * 364));
    EXPECT_TRUE(manager_->status("porch").has_value());
}

TEST_F(EventManagerTest, RetriggerDuringExportCreatesSuccessor) {
    exporter_->delay = milliseconds(500);
    startManager();
    manager_->startOrExtend(request("porch"));

    ASSERT_TRUE(waitUntil([this] { return exporter_->callCount() == 1; }));
    auto exporting = manager_->status("porch");
    ASSERT_TRUE(exporting.has_value());
    EXPECT_EQ(exporting->status, EventStatus::EXPORTING);

    auto successor = manager_->startOrExtend(request("porch"));
    EXPECT_TRUE(successor.created);
    EXPECT_GE(successor.event.startTime, exporting->endTime);

    ASSERT_TRUE(waitUntil([this] { return exporter_->callCount() == 2; }));
    auto requests = exporter_->requests();
    EXPECT_GE(requests[1].startTime, requests[0].endTime);
    EXPECT_TRUE(waitUntil([this] { return manager_->statusAll().empty(); }));
}
