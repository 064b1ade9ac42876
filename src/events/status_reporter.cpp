#include "events/status_reporter.h"
#include "logger.h"
#include "utils/time_utils.h"
#include <iomanip>
#include <sstream>

namespace pem {

StatusReporter::StatusReporter(const EventRegistry& registry, std::chrono::milliseconds interval)
    : registry_(registry), interval_(interval), running_(false) {
}

StatusReporter::~StatusReporter() {
    stop();
}

void StatusReporter::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    thread_ = std::thread(&StatusReporter::run, this);
}

void StatusReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string StatusReporter::formatLine(const Event& event, std::chrono::system_clock::time_point now) {
    std::stringstream ss;
    ss << "Event " << event.identifier
       << " | Status: " << eventStatusName(event.status)
       << ", Start: " << utils::formatTimestamp(event.startTime)
       << ", End: " << utils::formatTimestamp(event.endTime)
       << ", Remaining: " << std::fixed << std::setprecision(2) << event.remainingSeconds(now) << " seconds"
       << ", Cameras: " << describeCameras(event.cameras);
    return ss.str();
}

std::vector<std::string> StatusReporter::reportOnce() const {
    std::vector<std::string> lines;
    auto events = registry_.snapshot();
    if (events.empty()) {
        return lines;
    }

    auto now = std::chrono::system_clock::now();
    LOG_INFO("StatusReporter", "Logging " + std::to_string(events.size()) + " active event(s):");
    for (const auto& event : events) {
        lines.push_back(formatLine(event, now));
        LOG_INFO("StatusReporter", lines.back());
    }
    return lines;
}

void StatusReporter::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        lock.unlock();
        try {
            reportOnce();
        } catch (const std::exception& e) {
            LOG_ERROR("StatusReporter", std::string("Status report failed: ") + e.what());
        }
        lock.lock();
        cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

} // namespace pem
