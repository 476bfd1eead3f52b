#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

#include "capture/CaptureChain.hpp"
#include "capture/CaptureTypes.hpp"
#include "detect/IChangeDetector.hpp"
#include "platform/Time.hpp"

namespace roiwatch {

// Order matches the alternatives of EventPayload.
enum class EventType {
    MonitoringStarted,
    MonitoringStopped,
    ChangeDetected,
    CaptureFailed,
    StrategyChanged,
};

struct MonitoringStartedEvent {
    std::string sessionId;
    Region region;
    std::string strategy;
    double threshold = 0.0;
    int intervalMs = 0;
};

struct MonitoringStoppedEvent {
    std::string sessionId;
    std::string reason;
};

struct ChangeDetectedEvent {
    std::string sessionId;
    Verdict verdict;
    FramePtr frame;
    std::uint64_t changeNumber = 0;
};

struct CaptureFailedEvent {
    std::string sessionId;
    CaptureError error;
    int consecutiveFailures = 0;
};

struct StrategyChangedEvent {
    std::string sessionId;
    std::string oldStrategy;
    std::string newStrategy;
    bool baselineReset = false;
};

using EventPayload =
    std::variant<MonitoringStartedEvent, MonitoringStoppedEvent,
                 ChangeDetectedEvent, CaptureFailedEvent, StrategyChangedEvent>;

struct Event {
    Timestamp timestamp{};
    EventPayload payload;

    EventType type() const {
        return static_cast<EventType>(payload.index());
    }
};

inline Event makeEvent(EventPayload payload) {
    return Event{wallNow(), std::move(payload)};
}

inline std::string eventTypeToString(EventType type) {
    switch (type) {
        case EventType::MonitoringStarted:
            return "monitoring_started";
        case EventType::MonitoringStopped:
            return "monitoring_stopped";
        case EventType::ChangeDetected:
            return "change_detected";
        case EventType::CaptureFailed:
            return "capture_failed";
        case EventType::StrategyChanged:
            return "strategy_changed";
    }
    return "unknown";
}

}  // namespace roiwatch
