#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "background_task_manager.h"
#include "events/event.h"
#include "events/event_registry.h"
#include "events/event_scheduler.h"
#include "export/export_pipeline.h"

namespace pem {

/**
 * @brief Default window applied when a start request leaves it out
 */
struct EventDefaults {
    double pastMinutes = 5.0;
    double futureMinutes = 5.0;
};

/**
 * @brief A start-or-extend call as received from the HTTP layer
 */
struct StartRequest {
    std::string identifier;                              ///< Generated when empty
    std::optional<double> pastMinutes;
    std::optional<double> futureMinutes;
    std::optional<std::vector<std::string>> cameras;     ///< std::nullopt keeps the current set
};

struct StartResult {
    Event event;
    bool created = false;
    std::string message;
};

/**
 * @brief Event lifecycle facade
 *
 * Wires the registry, the per-event timers and the export workers together.
 * When an event's timer fires the event turns "exporting", its pipeline runs
 * on a worker, and the event is removed once the pipeline finishes whatever
 * the outcome.
 */
class EventManager {
public:
    /**
     * @brief Construct the manager; call start() to begin firing timers
     *
     * @param pipeline Export pipeline run for every fired event
     * @param defaults Window used when a request omits past/future minutes
     * @param exportWorkers Number of exports that may run concurrently
     */
    EventManager(std::shared_ptr<ExportPipeline> pipeline, EventDefaults defaults, size_t exportWorkers);
    ~EventManager();

    EventManager(const EventManager&) = delete;
    EventManager& operator=(const EventManager&) = delete;

    void start();
    void stop();

    /**
     * @brief Start a new event or extend an existing one
     *
     * @throws ValidationError for a malformed identifier or negative minutes
     */
    StartResult startOrExtend(const StartRequest& request);

    /**
     * @brief Cancel a pending event
     *
     * @return true if a pending event was removed before its export started
     * @throws ValidationError if the identifier is empty
     */
    bool cancel(const std::string& identifier);

    std::optional<Event> status(const std::string& identifier) const;
    std::vector<Event> statusAll() const;

    const EventRegistry& registry() const { return registry_; }
    BackgroundTaskManager& tasks() { return tasks_; }
    const EventDefaults& defaults() const { return defaults_; }

private:
    void onTimerFired(const std::string& identifier, uint64_t generation);
    static std::chrono::system_clock::duration toWindow(const char* name, double minutes);

    std::shared_ptr<ExportPipeline> pipeline_;
    EventDefaults defaults_;
    EventScheduler scheduler_;
    EventRegistry registry_;
    BackgroundTaskManager tasks_;
};

} // namespace pem
