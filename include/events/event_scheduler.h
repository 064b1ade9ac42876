#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace pem {

/**
 * @brief Timer operations the event registry relies on
 */
class TimerService {
public:
    virtual ~TimerService() = default;

    /**
     * @brief Install or replace the timer of an identifier
     *
     * @param identifier Event identifier
     * @param generation Token handed back on fire; an older generation never
     *                   replaces a newer one
     * @param deadline Wall-clock time at which the timer fires
     */
    virtual void arm(const std::string& identifier, uint64_t generation,
                     std::chrono::system_clock::time_point deadline) = 0;

    /**
     * @brief Remove the pending timer of an identifier
     *
     * @return true if a timer was pending, false if none was (or it already fired)
     */
    virtual bool disarm(const std::string& identifier) = 0;
};

/**
 * @brief One cancelable timer per event on a single timer thread
 *
 * Timers live in a deadline heap. Re-arming pushes a new heap entry and
 * records the new generation; stale heap entries are skipped when they come
 * due, so arm and disarm never search the heap. The fire callback runs on
 * the timer thread without the scheduler lock held.
 */
class EventScheduler : public TimerService {
public:
    using FireCallback = std::function<void(const std::string& identifier, uint64_t generation)>;

    explicit EventScheduler(FireCallback onFire);
    ~EventScheduler() override;

    EventScheduler(const EventScheduler&) = delete;
    EventScheduler& operator=(const EventScheduler&) = delete;

    void start();
    void stop();

    void arm(const std::string& identifier, uint64_t generation,
             std::chrono::system_clock::time_point deadline) override;
    bool disarm(const std::string& identifier) override;

    bool isArmed(const std::string& identifier) const;
    size_t armedCount() const;

private:
    using SteadyTime = std::chrono::steady_clock::time_point;

    struct HeapEntry {
        SteadyTime deadline;
        std::string identifier;
        uint64_t generation;

        bool operator>(const HeapEntry& other) const { return deadline > other.deadline; }
    };

    struct Timer {
        SteadyTime deadline;
        uint64_t generation;
    };

    void timerLoop();

    FireCallback onFire_;
    std::unordered_map<std::string, Timer> timers_;
    std::priority_queue<HeapEntry, std::vector<HeapEntry>, std::greater<HeapEntry>> heap_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread timerThread_;
    bool running_;
};

} // namespace pem
