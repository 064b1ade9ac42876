#include "events/event_manager.h"
#include "errors.h"
#include "logger.h"
#include "utils/id_utils.h"
#include "utils/time_utils.h"
#include <cmath>

namespace pem {

EventManager::EventManager(std::shared_ptr<ExportPipeline> pipeline, EventDefaults defaults, size_t exportWorkers)
    : pipeline_(std::move(pipeline)),
      defaults_(defaults),
      scheduler_([this](const std::string& identifier, uint64_t generation) {
          onTimerFired(identifier, generation);
      }),
      registry_(scheduler_),
      tasks_(exportWorkers) {
}

EventManager::~EventManager() {
    stop();
}

void EventManager::start() {
    scheduler_.start();
}

void EventManager::stop() {
    scheduler_.stop();
    tasks_.shutdown();
}

std::chrono::system_clock::duration EventManager::toWindow(const char* name, double minutes) {
    if (!std::isfinite(minutes) || minutes < 0) {
        throw ValidationError(std::string(name) + " must be a non-negative number of minutes");
    }
    if (minutes > utils::kMaxWindowMinutes) {
        throw ValidationError(std::string(name) + " must not exceed " +
                              std::to_string(static_cast<long long>(utils::kMaxWindowMinutes)) + " minutes");
    }
    return utils::minutesToDuration(minutes);
}

StartResult EventManager::startOrExtend(const StartRequest& request) {
    std::string identifier = request.identifier.empty() ? utils::generateUniqueId() : request.identifier;

    auto past = toWindow("past_minutes", request.pastMinutes.value_or(defaults_.pastMinutes));
    auto future = toWindow("future_minutes", request.futureMinutes.value_or(defaults_.futureMinutes));

    auto upsert = registry_.startOrExtend(identifier, past, future, request.cameras);

    StartResult result;
    result.event = upsert.event;
    result.created = upsert.created;
    result.message = upsert.created ? "New event " + identifier + " started"
                                    : "Event " + identifier + " extended";

    LOG_INFO("EventManager", "Scheduling export for event " + identifier + " in " +
             std::to_string(upsert.event.remainingSeconds(std::chrono::system_clock::now())) + " seconds");
    return result;
}

bool EventManager::cancel(const std::string& identifier) {
    if (identifier.empty()) {
        throw ValidationError("Missing event identifier");
    }
    if (!utils::isValidIdentifier(identifier)) {
        throw ValidationError("Invalid event identifier: " + identifier);
    }
    return registry_.cancel(identifier);
}

std::optional<Event> EventManager::status(const std::string& identifier) const {
    return registry_.find(identifier);
}

std::vector<Event> EventManager::statusAll() const {
    return registry_.snapshot();
}

void EventManager::onTimerFired(const std::string& identifier, uint64_t generation) {
    auto event = registry_.beginExport(identifier, generation);
    if (!event) {
        return;
    }

    LOG_INFO("EventManager", "Event " + identifier + " reached its end time, queueing export");
    tasks_.cleanupOldTasks();

    std::shared_ptr<ExportPipeline> pipeline = pipeline_;
    Event exporting = *event;
    std::string taskId = tasks_.submitTask(
        "export", identifier,
        [this, pipeline, exporting](BackgroundTaskManager::ProgressCallback progress) -> bool {
            PipelineResult result;
            try {
                result = pipeline->run(exporting, progress);
            } catch (const std::exception& e) {
                LOG_ERROR("EventManager", "Export pipeline for event " + exporting.identifier +
                          " threw: " + e.what());
                result.message = std::string("Export pipeline error: ") + e.what();
            }

            // The event leaves the registry whatever the outcome
            registry_.completeExport(exporting.identifier, exporting.sequence,
                                     result.exported ? EventStatus::COMPLETED : EventStatus::FAILED);

            if (progress) {
                progress(100.0, result.message);
            }
            return result.exported;
        });

    if (taskId.empty()) {
        LOG_ERROR("EventManager", "Could not queue export for event " + identifier + ", dropping it");
        registry_.completeExport(identifier, exporting.sequence, EventStatus::FAILED);
    }
}

} // namespace pem
