#include <gtest/gtest.h>
#include "events/event_scheduler.h"
#include "test_helpers.h"
#include <mutex>
#include <vector>

using namespace pem;
using namespace pem::testing_support;
using namespace std::chrono;

namespace {

struct FiredLog {
    std::mutex mutex;
    std::vector<std::pair<std::string, uint64_t>> fired;

    void record(const std::string& id, uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex);
        fired.emplace_back(id, generation);
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex);
        return fired.size();
    }
};

} // namespace

TEST(EventSchedulerTest, FiresAtDeadline) {
    FiredLog log;
    EventScheduler scheduler([&log](const std::string& id, uint64_t gen) { log.record(id, gen); });
    scheduler.start();

    auto armedAt = steady_clock::now();
    scheduler.arm("a", 1, system_clock::now() + milliseconds(100));
    EXPECT_TRUE(scheduler.isArmed("a"));

    ASSERT_TRUE(waitUntil([&log] { return log.size() == 1; }));
    EXPECT_GE(steady_clock::now() - armedAt, milliseconds(90));
    EXPECT_EQ(log.fired[0], std::make_pair(std::string("a"), uint64_t{1}));
    EXPECT_FALSE(scheduler.isArmed("a"));
    scheduler.stop();
}

TEST(EventSchedulerTest, RearmReplacesEarlierDeadline) {
    FiredLog log;
    EventScheduler scheduler([&log](const std::string& id, uint64_t gen) { log.record(id, gen); });
    scheduler.start();

    scheduler.arm("a", 1, system_clock::now() + milliseconds(100));
    scheduler.arm("a", 2, system_clock::now() + milliseconds(400));
    EXPECT_EQ(scheduler.armedCount(), 1u);

    std::this_thread::sleep_for(milliseconds(250));
    EXPECT_EQ(log.size(), 0u);

    ASSERT_TRUE(waitUntil([&log] { return log.size() == 1; }));
    EXPECT_EQ(log.fired[0].second, 2u);
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(log.size(), 1u);
    scheduler.stop();
}

TEST(EventSchedulerTest, StaleArmIsIgnored) {
    FiredLog log;
    EventScheduler scheduler([&log](const std::string& id, uint64_t gen) { log.record(id, gen); });
    scheduler.start();

    scheduler.arm("a", 5, system_clock::now() + milliseconds(200));
    scheduler.arm("a", 3, system_clock::now() + milliseconds(50));

    ASSERT_TRUE(waitUntil([&log] { return log.size() == 1; }));
    EXPECT_EQ(log.fired[0].second, 5u);
    scheduler.stop();
}

TEST(EventSchedulerTest, DisarmedTimerNeverFires) {
    FiredLog log;
    EventScheduler scheduler([&log](const std::string& id, uint64_t gen) { log.record(id, gen); });
    scheduler.start();

    scheduler.arm("a", 1, system_clock::now() + milliseconds(100));
    EXPECT_TRUE(scheduler.disarm("a"));
    EXPECT_FALSE(scheduler.disarm("a"));

    std::this_thread::sleep_for(milliseconds(300));
    EXPECT_EQ(log.size(), 0u);
    scheduler.stop();
}

TEST(EventSchedulerTest, PastDeadlineFiresImmediately) {
    FiredLog log;
    EventScheduler scheduler([&log](const std::string& id, uint64_t gen) { log.record(id, gen); });
    scheduler.start();

    scheduler.arm("late", 1, system_clock::now() - seconds(5));
    EXPECT_TRUE(waitUntil([&log] { return log.size() == 1; }, milliseconds(500)));
    scheduler.stop();
}

TEST(EventSchedulerTest, IndependentTimersFireInDeadlineOrder) {
    FiredLog log;
    EventScheduler scheduler([&log](const std::string& id, uint64_t gen) { log.record(id, gen); });
    scheduler.start();

    auto now = system_clock::now();
    scheduler.arm("second", 1, now + milliseconds(200));
    scheduler.arm("first", 2, now + milliseconds(50));

    ASSERT_TRUE(waitUntil([&log] { return log.size() == 2; }));
    EXPECT_EQ(log.fired[0].first, "first");
    EXPECT_EQ(log.fired[1].first, "second");
    scheduler.stop();
}
