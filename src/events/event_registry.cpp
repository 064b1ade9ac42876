#include "events/event_registry.h"
#include "errors.h"
#include "logger.h"
#include "utils/id_utils.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <functional>

namespace pem {

const Event* EventRegistry::Slot::current() const {
    if (pending) {
        return &*pending;
    }
    if (!exporting.empty()) {
        return &exporting.front();
    }
    return nullptr;
}

EventRegistry::EventRegistry(TimerService& timers, size_t stripeCount)
    : timers_(timers), nextSequence_(0), nextGeneration_(0), contentions_(0) {
    if (stripeCount == 0) {
        stripeCount = 1;
    }
    stripes_.reserve(stripeCount);
    for (size_t i = 0; i < stripeCount; ++i) {
        stripes_.push_back(std::make_unique<Stripe>());
    }
}

size_t EventRegistry::stripeIndex(const std::string& identifier) const {
    return std::hash<std::string>{}(identifier) % stripes_.size();
}

EventRegistry::Stripe& EventRegistry::stripeFor(const std::string& identifier) const {
    return *stripes_[stripeIndex(identifier)];
}

std::unique_lock<std::mutex> EventRegistry::lockStripe(const Stripe& stripe) const {
    std::unique_lock<std::mutex> lock(stripe.mutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        contentions_.fetch_add(1, std::memory_order_relaxed);
        lock.lock();
    }
    return lock;
}

EventRegistry::UpsertResult EventRegistry::startOrExtend(
    const std::string& identifier,
    std::chrono::system_clock::duration past,
    std::chrono::system_clock::duration future,
    const std::optional<std::vector<std::string>>& cameras,
    std::chrono::system_clock::time_point now) {

    if (!utils::isValidIdentifier(identifier)) {
        throw ValidationError("Invalid event identifier '" + identifier + "'");
    }
    if (past.count() < 0 || future.count() < 0) {
        throw ValidationError("past and future windows must not be negative");
    }

    auto requestedEnd = now + future;

    Stripe& stripe = stripeFor(identifier);
    auto lock = lockStripe(stripe);
    Slot& slot = stripe.slots[identifier];

    UpsertResult result{Event{}, false};

    if (slot.pending) {
        Event& event = *slot.pending;
        event.endTime = std::max(event.endTime, requestedEnd);
        if (cameras) {
            event.cameras = normalizeCameras(*cameras);
        }
        event.generation = ++nextGeneration_;
        timers_.arm(identifier, event.generation, event.endTime);
        result.event = event;

        LOG_INFO("EventRegistry", "Event " + identifier + " extended. Start: " +
                 utils::formatTimestamp(event.startTime) + ", End: " + utils::formatTimestamp(event.endTime));
        return result;
    }

    Event event;
    event.identifier = identifier;
    event.startTime = now - past;
    for (const auto& running : slot.exporting) {
        // Successor of an export in flight: do not export the same footage twice
        event.startTime = std::max(event.startTime, running.endTime);
    }
    event.endTime = std::max(requestedEnd, event.startTime);
    event.cameras = cameras ? normalizeCameras(*cameras) : std::vector<std::string>{};
    event.status = EventStatus::PENDING;
    event.sequence = ++nextSequence_;
    event.generation = ++nextGeneration_;

    timers_.arm(identifier, event.generation, event.endTime);
    slot.pending = event;
    result.event = event;
    result.created = true;

    LOG_INFO("EventRegistry", std::string(slot.exporting.empty() ? "New event " : "Successor event ") +
             identifier + " started. Start: " + utils::formatTimestamp(event.startTime) +
             ", End: " + utils::formatTimestamp(event.endTime) + ", Cameras: " + describeCameras(event.cameras));
    return result;
}

bool EventRegistry::cancel(const std::string& identifier) {
    Stripe& stripe = stripeFor(identifier);
    auto lock = lockStripe(stripe);

    auto it = stripe.slots.find(identifier);
    if (it == stripe.slots.end() || !it->second.pending) {
        if (it != stripe.slots.end() && !it->second.exporting.empty()) {
            LOG_WARN("EventRegistry", "Event " + identifier + " is already exporting, nothing to cancel");
        } else {
            LOG_WARN("EventRegistry", "No event found with identifier " + identifier);
        }
        return false;
    }

    timers_.disarm(identifier);
    it->second.pending.reset();
    if (it->second.empty()) {
        stripe.slots.erase(it);
    }

    LOG_INFO("EventRegistry", "Cancelled event " + identifier);
    return true;
}

std::optional<Event> EventRegistry::beginExport(const std::string& identifier, uint64_t generation) {
    Stripe& stripe = stripeFor(identifier);
    auto lock = lockStripe(stripe);

    auto it = stripe.slots.find(identifier);
    if (it == stripe.slots.end() || !it->second.pending) {
        LOG_INFO("EventRegistry", "Event " + identifier + " was already cancelled or does not exist");
        return std::nullopt;
    }

    Slot& slot = it->second;
    if (slot.pending->generation != generation) {
        LOG_DEBUG("EventRegistry", "Ignoring superseded timer for " + identifier);
        return std::nullopt;
    }

    Event event = *slot.pending;
    event.status = EventStatus::EXPORTING;
    slot.exporting.push_back(event);
    slot.pending.reset();
    return event;
}

bool EventRegistry::completeExport(const std::string& identifier, uint64_t sequence, EventStatus finalStatus) {
    Stripe& stripe = stripeFor(identifier);
    auto lock = lockStripe(stripe);

    auto it = stripe.slots.find(identifier);
    if (it == stripe.slots.end()) {
        LOG_WARN("EventRegistry", "Event " + identifier + " was already removed");
        return false;
    }

    auto& exporting = it->second.exporting;
    auto match = std::find_if(exporting.begin(), exporting.end(),
                              [sequence](const Event& e) { return e.sequence == sequence; });
    if (match == exporting.end()) {
        LOG_WARN("EventRegistry", "Event " + identifier + " was already removed");
        return false;
    }

    exporting.erase(match);
    if (it->second.empty()) {
        stripe.slots.erase(it);
    }

    LOG_INFO("EventRegistry", "Event " + identifier + " removed after export (" +
             eventStatusName(finalStatus) + ")");
    return true;
}

std::optional<Event> EventRegistry::find(const std::string& identifier) const {
    Stripe& stripe = stripeFor(identifier);
    auto lock = lockStripe(stripe);

    auto it = stripe.slots.find(identifier);
    if (it == stripe.slots.end()) {
        return std::nullopt;
    }
    const Event* event = it->second.current();
    if (!event) {
        return std::nullopt;
    }
    return *event;
}

std::vector<Event> EventRegistry::snapshot() const {
    std::vector<Event> events;
    for (const auto& stripe : stripes_) {
        auto lock = lockStripe(*stripe);
        for (const auto& pair : stripe->slots) {
            if (const Event* event = pair.second.current()) {
                events.push_back(*event);
            }
        }
    }

    std::sort(events.begin(), events.end(), [](const Event& a, const Event& b) {
        return a.sequence < b.sequence;
    });
    return events;
}

size_t EventRegistry::size() const {
    size_t count = 0;
    for (const auto& stripe : stripes_) {
        auto lock = lockStripe(*stripe);
        count += stripe->slots.size();
    }
    return count;
}

} // namespace pem
