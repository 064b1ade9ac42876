#include "events/event_scheduler.h"
#include "logger.h"

namespace pem {

EventScheduler::EventScheduler(FireCallback onFire)
    : onFire_(std::move(onFire)), running_(false) {
}

EventScheduler::~EventScheduler() {
    stop();
}

void EventScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    timerThread_ = std::thread(&EventScheduler::timerLoop, this);
    LOG_INFO("EventScheduler", "Event scheduler started");
}

void EventScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }

    cv_.notify_all();

    if (timerThread_.joinable()) {
        timerThread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!timers_.empty()) {
        LOG_WARN("EventScheduler", "Stopped with " + std::to_string(timers_.size()) + " timer(s) still armed");
    }
    LOG_INFO("EventScheduler", "Event scheduler stopped");
}

void EventScheduler::arm(const std::string& identifier, uint64_t generation,
                         std::chrono::system_clock::time_point deadline) {
    // Wall-clock deadline converted once; later clock adjustments do not move it
    auto delay = deadline - std::chrono::system_clock::now();
    SteadyTime steadyDeadline = std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(identifier);
        if (it != timers_.end() && it->second.generation > generation) {
            LOG_DEBUG("EventScheduler", "Ignoring stale arm for " + identifier);
            return;
        }
        timers_[identifier] = Timer{steadyDeadline, generation};
        heap_.push(HeapEntry{steadyDeadline, identifier, generation});
    }

    cv_.notify_all();

    LOG_DEBUG("EventScheduler", "Timer for " + identifier + " fires in " +
              std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(delay).count()) + "ms");
}

bool EventScheduler::disarm(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    // The heap entry stays behind and is discarded when it comes due
    return timers_.erase(identifier) > 0;
}

bool EventScheduler::isArmed(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.find(identifier) != timers_.end();
}

size_t EventScheduler::armedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void EventScheduler::timerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        if (heap_.empty()) {
            cv_.wait(lock, [this] { return !running_ || !heap_.empty(); });
            continue;
        }

        SteadyTime next = heap_.top().deadline;
        if (std::chrono::steady_clock::now() < next) {
            cv_.wait_until(lock, next);
            continue;
        }

        std::vector<std::pair<std::string, uint64_t>> due;
        auto now = std::chrono::steady_clock::now();
        while (!heap_.empty() && heap_.top().deadline <= now) {
            HeapEntry entry = heap_.top();
            heap_.pop();

            auto it = timers_.find(entry.identifier);
            if (it == timers_.end() || it->second.generation != entry.generation) {
                continue;  // disarmed or re-armed since this entry was pushed
            }
            timers_.erase(it);
            due.emplace_back(entry.identifier, entry.generation);
        }

        lock.unlock();
        for (const auto& fired : due) {
            try {
                onFire_(fired.first, fired.second);
            } catch (const std::exception& e) {
                LOG_ERROR("EventScheduler", "Timer callback for " + fired.first + " threw: " + e.what());
            }
        }
        lock.lock();
    }
}

} // namespace pem
