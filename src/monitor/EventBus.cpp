#include "monitor/EventBus.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "platform/Log.hpp"

namespace roiwatch {

EventBus::SubscriptionId EventBus::subscribe(EventType type,
                                             EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextId_++;
    subscriptions_.push_back(Subscription{id, type, std::move(handler)});
    return id;
}

EventBus::SubscriptionId EventBus::subscribeAll(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = nextId_++;
    subscriptions_.push_back(
        Subscription{id, std::nullopt, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscriptions_.end()) {
        return false;
    }
    subscriptions_.erase(it);
    return true;
}

void EventBus::publish(const Event& event) {
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sub : subscriptions_) {
            if (!sub.type || *sub.type == event.type()) {
                handlers.push_back(sub.handler);
            }
        }
    }
    for (auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("event handler for %s threw: %s",
                      eventTypeToString(event.type()).c_str(), e.what());
        } catch (...) {
            LOG_ERROR("event handler for %s threw a non-standard exception",
                      eventTypeToString(event.type()).c_str());
        }
    }
}

size_t EventBus::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

}  // namespace roiwatch
