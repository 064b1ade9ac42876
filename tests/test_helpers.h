#pragma once

#include "export/exporter.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pem {
namespace testing_support {

/**
 * @brief In-process exporter that records requests
 *
 * Fails the first failuresBeforeSuccess calls, then succeeds. An optional
 * hook runs on every call (used to drop segment files into the folder).
 */
class FakeExporter : public Exporter {
public:
    explicit FakeExporter(int failuresBeforeSuccess = 0) : failuresLeft_(failuresBeforeSuccess) {}

    ExportResult exportRange(const ExportRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        if (hook) {
            hook(request);
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (failuresLeft_.load() > 0) {
            --failuresLeft_;
            return ExportResult::failed(1, "simulated failure");
        }
        return ExportResult::ok();
    }

    std::vector<ExportRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::function<void(const ExportRequest&)> hook;
    std::chrono::milliseconds delay{0};

private:
    std::atomic<int> failuresLeft_;
    mutable std::mutex mutex_;
    std::vector<ExportRequest> requests_;
};

/**
 * @brief Poll a condition until it holds or the timeout expires
 */
inline bool waitUntil(const std::function<bool()>& condition,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

} // namespace testing_support
} // namespace pem
