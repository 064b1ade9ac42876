#include "events/event.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <cctype>

namespace pem {

std::string eventStatusName(EventStatus status) {
    switch (status) {
        case EventStatus::PENDING:   return "pending";
        case EventStatus::EXPORTING: return "exporting";
        case EventStatus::COMPLETED: return "completed";
        case EventStatus::FAILED:    return "failed";
        case EventStatus::CANCELED:  return "canceled";
        default:                     return "unknown";
    }
}

double Event::remainingSeconds(std::chrono::system_clock::time_point now) const {
    return std::max(0.0, utils::secondsBetween(now, endTime));
}

nlohmann::json Event::toJson(std::chrono::system_clock::time_point now) const {
    nlohmann::json json;
    json["start_time"] = utils::formatTimestamp(startTime);
    json["end_time"] = utils::formatTimestamp(endTime);
    json["remaining_time_seconds"] = remainingSeconds(now);
    json["cameras"] = cameras;
    json["status"] = eventStatusName(status);
    return json;
}

std::vector<std::string> normalizeCameras(const std::vector<std::string>& cameras) {
    std::vector<std::string> normalized;
    for (const auto& camera : cameras) {
        auto first = std::find_if_not(camera.begin(), camera.end(),
                                      [](unsigned char c) { return std::isspace(c); });
        auto last = std::find_if_not(camera.rbegin(), camera.rend(),
                                     [](unsigned char c) { return std::isspace(c); }).base();
        if (first < last) {
            normalized.emplace_back(first, last);
        }
    }
    return normalized;
}

std::string describeCameras(const std::vector<std::string>& cameras) {
    if (cameras.empty()) {
        return "all";
    }
    std::string joined;
    for (const auto& camera : cameras) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += camera;
    }
    return joined;
}

} // namespace pem
