#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "events/event_registry.h"

namespace pem {

/**
 * @brief Periodically logs every active event
 *
 * Read-only consumer of the registry.
 */
class StatusReporter {
public:
    StatusReporter(const EventRegistry& registry, std::chrono::milliseconds interval);
    ~StatusReporter();

    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    void start();
    void stop();

    /**
     * @brief Log one report now
     *
     * @return std::vector<std::string> The per-event lines that were logged
     */
    std::vector<std::string> reportOnce() const;

    /**
     * @brief Format the report line of one event
     */
    static std::string formatLine(const Event& event, std::chrono::system_clock::time_point now);

private:
    void run();

    const EventRegistry& registry_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool running_;
};

} // namespace pem
