#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pem {

enum class EventStatus {
    PENDING,
    EXPORTING,
    COMPLETED,
    FAILED,
    CANCELED
};

std::string eventStatusName(EventStatus status);

/**
 * @brief A tracked recording window for a camera set
 *
 * An empty camera list means "all cameras". sequence distinguishes
 * successive events that reuse an identifier; generation identifies the
 * timer currently armed for the event.
 */
struct Event {
    std::string identifier;
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;
    std::vector<std::string> cameras;
    EventStatus status = EventStatus::PENDING;
    uint64_t sequence = 0;
    uint64_t generation = 0;

    bool allCameras() const { return cameras.empty(); }

    /**
     * @brief Seconds until endTime, clamped to zero
     */
    double remainingSeconds(std::chrono::system_clock::time_point now) const;

    /**
     * @brief Status view used by the HTTP layer and the web UI
     *
     * Keys: start_time, end_time, remaining_time_seconds, cameras, status.
     */
    nlohmann::json toJson(std::chrono::system_clock::time_point now) const;
};

/**
 * @brief Drop blank camera ids and surrounding whitespace
 *
 * An all-blank list collapses to the empty "all cameras" list.
 */
std::vector<std::string> normalizeCameras(const std::vector<std::string>& cameras);

/**
 * @brief Comma separated camera list, or "all"
 */
std::string describeCameras(const std::vector<std::string>& cameras);

} // namespace pem
