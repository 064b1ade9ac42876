#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "events/event.h"
#include "events/event_scheduler.h"

namespace pem {

/**
 * @brief In-memory table of active events
 *
 * Owns every lifecycle transition: create, extend, cancel, begin export and
 * complete export. The table is split into lock stripes hashed by
 * identifier; operations on one identifier are serialized by its stripe,
 * operations on identifiers in different stripes never wait on each other.
 * Timers are armed and disarmed while the stripe lock is held, so the timer
 * state always matches the event state.
 */
class EventRegistry {
public:
    struct UpsertResult {
        Event event;
        bool created;
    };

    /**
     * @brief Construct a registry
     *
     * @param timers Timer service armed for every pending event
     * @param stripeCount Number of independently locked stripes
     */
    explicit EventRegistry(TimerService& timers, size_t stripeCount = 16);

    EventRegistry(const EventRegistry&) = delete;
    EventRegistry& operator=(const EventRegistry&) = delete;

    /**
     * @brief Create an event or extend the pending one
     *
     * A new event spans [now - past, now + future]. Extending sets the end to
     * max(current end, now + future) and re-arms the timer. Supplied cameras
     * replace the set; std::nullopt keeps it. If the identifier is currently
     * exporting, a successor event is created that starts no earlier than
     * the exporting window's end.
     *
     * @throws ValidationError for a malformed identifier or negative window
     */
    UpsertResult startOrExtend(const std::string& identifier,
                               std::chrono::system_clock::duration past,
                               std::chrono::system_clock::duration future,
                               const std::optional<std::vector<std::string>>& cameras,
                               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief Remove a pending event and its timer
     *
     * @return true if a pending event existed; an event that is already
     *         exporting is left alone and reported as false
     */
    bool cancel(const std::string& identifier);

    /**
     * @brief Move a pending event to exporting when its timer fires
     *
     * @param identifier Event identifier
     * @param generation Generation carried by the fired timer
     * @return The exporting event, or std::nullopt if the event was canceled
     *         or re-armed after this timer was installed
     */
    std::optional<Event> beginExport(const std::string& identifier, uint64_t generation);

    /**
     * @brief Drop an exporting event once its pipeline finished
     *
     * @return true if the event was found and removed
     */
    bool completeExport(const std::string& identifier, uint64_t sequence, EventStatus finalStatus);

    /**
     * @brief Copy of the event for an identifier (pending preferred)
     */
    std::optional<Event> find(const std::string& identifier) const;

    /**
     * @brief Copies of all active events, one per identifier
     */
    std::vector<Event> snapshot() const;

    size_t size() const;

    size_t stripeIndex(const std::string& identifier) const;

    /**
     * @brief Number of stripe lock acquisitions that had to wait
     */
    uint64_t lockContentions() const { return contentions_.load(std::memory_order_relaxed); }

private:
    struct Slot {
        std::optional<Event> pending;
        std::vector<Event> exporting;   ///< Usually at most one

        bool empty() const { return !pending && exporting.empty(); }
        const Event* current() const;
    };

    struct Stripe {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Slot> slots;
    };

    std::unique_lock<std::mutex> lockStripe(const Stripe& stripe) const;
    Stripe& stripeFor(const std::string& identifier) const;

    TimerService& timers_;
    std::vector<std::unique_ptr<Stripe>> stripes_;
    std::atomic<uint64_t> nextSequence_;
    std::atomic<uint64_t> nextGeneration_;
    mutable std::atomic<uint64_t> contentions_;
};

} // namespace pem
