#pragma once

#include <cstdint>
#include <memory>

#include "capture/CaptureTypes.hpp"
#include "detect/IChangeDetector.hpp"

namespace roiwatch {

// Holds the active strategy, the baseline frame and the threshold for one
// monitoring session. Not synchronized: the owner serializes access.
class DetectionContext {
public:
    // What a comparison needs, captured so the comparison itself can run
    // without the owner's lock.
    struct Snapshot {
        std::shared_ptr<const IChangeDetector> detector;
        FramePtr baseline;
        double threshold = 0.0;
        std::uint64_t generation = 0;
    };

    DetectionContext(DetectionKind kind, double threshold);

    DetectionKind kind() const {
        return kind_;
    }
    std::string strategyName() const;

    // Keeps the baseline unless `resetBaseline` is set, in which case the
    // next frame seeds a new one.
    void setStrategy(DetectionKind kind, bool resetBaseline);

    double threshold() const {
        return threshold_;
    }
    void setThreshold(double threshold);

    const FramePtr& baseline() const {
        return baseline_;
    }
    bool hasBaseline() const {
        return baseline_ != nullptr;
    }
    // A null frame clears the baseline.
    void resetBaseline(FramePtr frame);

    // Bumped whenever strategy, threshold or baseline change; a comparison
    // run against an older snapshot must be discarded.
    std::uint64_t generation() const {
        return generation_;
    }

    Snapshot snapshot() const;

    // False when there is no baseline to compare against.
    bool compare(const Frame& candidate, Verdict& out) const;

    static bool evaluate(const Snapshot& snap, const Frame& candidate,
                         Verdict& out);

private:
    DetectionKind kind_;
    std::shared_ptr<const IChangeDetector> detector_;
    FramePtr baseline_;
    double threshold_;
    std::uint64_t generation_ = 0;
};

}  // namespace roiwatch
