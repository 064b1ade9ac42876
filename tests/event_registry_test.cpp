#include <gtest/gtest.h>
#include "errors.h"
#include "events/event_registry.h"
#include <atomic>
#include <map>
#include <thread>

using namespace pem;
using namespace std::chrono;

namespace {

class RecordingTimers : public TimerService {
public:
    void arm(const std::string& identifier, uint64_t generation, system_clock::time_point deadline) override {
        std::lock_guard<std::mutex> lock(mutex_);
        armed[identifier] = std::make_pair(generation, deadline);
        ++armCalls;
    }

    bool disarm(const std::string& identifier) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return armed.erase(identifier) > 0;
    }

    std::map<std::string, std::pair<uint64_t, system_clock::time_point>> armed;
    int armCalls = 0;

private:
    std::mutex mutex_;
};

const system_clock::time_point kNow = system_clock::from_time_t(1700000000);

} // namespace

TEST(EventRegistryTest, StartCreatesPendingEventAndArmsTimer) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    auto result = registry.startOrExtend("door", minutes(5), minutes(5), std::nullopt, kNow);

    EXPECT_TRUE(result.created);
    EXPECT_EQ(result.event.status, EventStatus::PENDING);
    EXPECT_EQ(result.event.startTime, kNow - minutes(5));
    EXPECT_EQ(result.event.endTime, kNow + minutes(5));
    EXPECT_TRUE(result.event.allCameras());

    ASSERT_EQ(timers.armed.count("door"), 1u);
    EXPECT_EQ(timers.armed["door"].first, result.event.generation);
    EXPECT_EQ(timers.armed["door"].second, result.event.endTime);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(EventRegistryTest, ExtendNeverMovesEndTimeBackwards) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    auto first = registry.startOrExtend("door", minutes(5), minutes(10), std::nullopt, kNow);
    auto shorter = registry.startOrExtend("door", minutes(5), minutes(1), std::nullopt, kNow + seconds(30));
    EXPECT_FALSE(shorter.created);
    EXPECT_EQ(shorter.event.endTime, first.event.endTime);
    EXPECT_EQ(shorter.event.startTime, first.event.startTime);

    auto longer = registry.startOrExtend("door", minutes(5), minutes(10), std::nullopt, kNow + minutes(2));
    EXPECT_EQ(longer.event.endTime, kNow + minutes(12));
    EXPECT_EQ(longer.event.sequence, first.event.sequence);
    EXPECT_GT(longer.event.generation, shorter.event.generation);
    EXPECT_EQ(timers.armed["door"].first, longer.event.generation);
}

TEST(EventRegistryTest, ExtendReplacesCamerasOnlyWhenGiven) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    registry.startOrExtend("door", minutes(1), minutes(1), std::vector<std::string>{"cam1"}, kNow);
    auto kept = registry.startOrExtend("door", minutes(1), minutes(1), std::nullopt, kNow);
    EXPECT_EQ(kept.event.cameras, std::vector<std::string>{"cam1"});

    auto replaced = registry.startOrExtend("door", minutes(1), minutes(1),
                                           std::vector<std::string>{"cam2", " ", "cam3"}, kNow);
    EXPECT_EQ(replaced.event.cameras, (std::vector<std::string>{"cam2", "cam3"}));

    auto all = registry.startOrExtend("door", minutes(1), minutes(1), std::vector<std::string>{}, kNow);
    EXPECT_TRUE(all.event.allCameras());
}

TEST(EventRegistryTest, RejectsInvalidIdentifiersAndNegativeWindows) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    EXPECT_THROW(registry.startOrExtend("", minutes(1), minutes(1), std::nullopt, kNow), ValidationError);
    EXPECT_THROW(registry.startOrExtend("../x", minutes(1), minutes(1), std::nullopt, kNow), ValidationError);
    EXPECT_THROW(registry.startOrExtend("ok", minutes(-1), minutes(1), std::nullopt, kNow), ValidationError);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(timers.armCalls, 0);
}

TEST(EventRegistryTest, CancelRemovesPendingEventAndDisarms) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    auto event = registry.startOrExtend("door", minutes(1), minutes(1), std::nullopt, kNow).event;
    EXPECT_TRUE(registry.cancel("door"));
    EXPECT_EQ(timers.armed.count("door"), 0u);
    EXPECT_FALSE(registry.find("door").has_value());

    // A timer that was already in flight finds nothing to export
    EXPECT_FALSE(registry.beginExport("door", event.generation).has_value());
}

TEST(EventRegistryTest, CancelOfUnknownIdentifierReturnsFalse) {
    RecordingTimers timers;
    EventRegistry registry(timers);
    EXPECT_FALSE(registry.cancel("nobody"));
}

TEST(EventRegistryTest, StaleGenerationDoesNotBeginExport) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    auto first = registry.startOrExtend("door", minutes(1), minutes(1), std::nullopt, kNow).event;
    auto extended = registry.startOrExtend("door", minutes(1), minutes(2), std::nullopt, kNow).event;

    EXPECT_FALSE(registry.beginExport("door", first.generation).has_value());
    auto exporting = registry.beginExport("door", extended.generation);
    ASSERT_TRUE(exporting.has_value());
    EXPECT_EQ(exporting->status, EventStatus::EXPORTING);
}

TEST(EventRegistryTest, ExportingEventCannotBeCancelledAndIsRemovedOnCompletion) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    auto event = registry.startOrExtend("door", minutes(1), minutes(1), std::nullopt, kNow).event;
    auto exporting = registry.beginExport("door", event.generation);
    ASSERT_TRUE(exporting.has_value());

    EXPECT_FALSE(registry.cancel("door"));
    auto found = registry.find("door");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->status, EventStatus::EXPORTING);

    EXPECT_TRUE(registry.completeExport("door", exporting->sequence, EventStatus::COMPLETED));
    EXPECT_FALSE(registry.find("door").has_value());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.completeExport("door", exporting->sequence, EventStatus::COMPLETED));
}

TEST(EventRegistryTest, RetriggerDuringExportStartsSuccessorAfterPreviousEnd) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    auto event = registry.startOrExtend("door", minutes(5), minutes(1), std::nullopt, kNow).event;
    auto exporting = registry.beginExport("door", event.generation);
    ASSERT_TRUE(exporting.has_value());

    auto successor = registry.startOrExtend("door", minutes(5), minutes(3), std::nullopt, kNow + minutes(1));
    EXPECT_TRUE(successor.created);
    EXPECT_NE(successor.event.sequence, event.sequence);
    EXPECT_EQ(successor.event.startTime, event.endTime);
    EXPECT_EQ(successor.event.endTime, kNow + minutes(4));

    // The pending successor is what status shows, and what cancel removes
    EXPECT_EQ(registry.find("door")->sequence, successor.event.sequence);
    EXPECT_TRUE(registry.cancel("door"));
    EXPECT_EQ(registry.find("door")->status, EventStatus::EXPORTING);

    EXPECT_TRUE(registry.completeExport("door", exporting->sequence, EventStatus::FAILED));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(EventRegistryTest, SnapshotIsOrderedByCreation) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    registry.startOrExtend("c", minutes(1), minutes(1), std::nullopt, kNow);
    registry.startOrExtend("a", minutes(1), minutes(1), std::nullopt, kNow);
    registry.startOrExtend("b", minutes(1), minutes(1), std::nullopt, kNow);

    auto events = registry.snapshot();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].identifier, "c");
    EXPECT_EQ(events[1].identifier, "a");
    EXPECT_EQ(events[2].identifier, "b");
}

TEST(EventRegistryTest, IdentifiersInDifferentStripesDoNotContend) {
    RecordingTimers timers;
    EventRegistry registry(timers, 16);

    // Pick two identifiers that hash to different stripes
    std::string first = "event-0";
    std::string second;
    for (int i = 1; i < 100 && second.empty(); ++i) {
        std::string candidate = "event-" + std::to_string(i);
        if (registry.stripeIndex(candidate) != registry.stripeIndex(first)) {
            second = candidate;
        }
    }
    ASSERT_FALSE(second.empty());

    auto hammer = [&registry](const std::string& id) {
        for (int i = 0; i < 500; ++i) {
            registry.startOrExtend(id, seconds(1), seconds(60), std::nullopt, kNow);
            registry.find(id);
        }
    };
    std::thread a(hammer, first);
    std::thread b(hammer, second);
    a.join();
    b.join();

    EXPECT_EQ(registry.lockContentions(), 0u);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(EventRegistryTest, ConcurrentStartsOnOneIdentifierCreateOneEvent) {
    RecordingTimers timers;
    EventRegistry registry(timers);

    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&registry, &created]() {
            for (int i = 0; i < 100; ++i) {
                if (registry.startOrExtend("shared", seconds(1), seconds(60), std::nullopt).created) {
                    ++created;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(registry.size(), 1u);
}
