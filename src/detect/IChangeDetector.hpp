#pragma once

#include <memory>
#include <string>

#include "capture/CaptureTypes.hpp"
#include "platform/Time.hpp"

namespace roiwatch {

enum class DetectionKind { Size, Pixel, Hash };

struct Verdict {
    bool changed = false;
    // Strategy-specific units; all built-in strategies report 0-100.
    double magnitude = 0.0;
    std::string strategy;
    Timestamp comparedAt{};
    double elapsedMs = 0.0;
};

// Pure comparison of two frames. Implementations keep no state, so one
// instance can be shared between threads.
class IChangeDetector {
public:
    virtual ~IChangeDetector() = default;
    virtual DetectionKind kind() const = 0;
    virtual std::string name() const = 0;
    virtual Verdict compare(const Frame& baseline, const Frame& candidate,
                            double threshold) const = 0;
};

inline Verdict makeVerdict(const std::string& strategy, bool changed,
                           double magnitude) {
    Verdict v;
    v.changed = changed;
    v.magnitude = magnitude;
    v.strategy = strategy;
    v.comparedAt = wallNow();
    return v;
}

}  // namespace roiwatch
