#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace pem {
namespace utils {

/**
 * @brief Shutdown flag with an interruptible sleep
 */
class StopFlag {
public:
    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    /**
     * @brief Sleep for the given duration unless a stop is requested
     *
     * @return true if the full duration elapsed, false if stopped
     */
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return stopped_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

} // namespace utils
} // namespace pem
