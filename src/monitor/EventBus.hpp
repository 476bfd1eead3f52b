#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "monitor/Events.hpp"

namespace roiwatch {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe. Handlers run on the publishing thread and
// should hand slow work off elsewhere. Handlers may subscribe, unsubscribe
// or call back into the monitor; the bus holds no lock while they run.
class EventBus {
public:
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(EventType type, EventHandler handler);
    SubscriptionId subscribeAll(EventHandler handler);
    bool unsubscribe(SubscriptionId id);

    void publish(const Event& event);

    size_t subscriberCount() const;

private:
    struct Subscription {
        SubscriptionId id = 0;
        std::optional<EventType> type;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    SubscriptionId nextId_ = 1;
};

}  // namespace roiwatch
