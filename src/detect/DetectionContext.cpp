#include "detect/DetectionContext.hpp"

#include <chrono>
#include <utility>

#include "detect/DetectorFactory.hpp"
#include "platform/Log.hpp"
#include "platform/Time.hpp"

namespace roiwatch {

DetectionContext::DetectionContext(DetectionKind kind, double threshold)
    : kind_(kind), detector_(CreateDetector(kind)), threshold_(threshold) {}

std::string DetectionContext::strategyName() const {
    return detector_ ? detector_->name() : detectionKindToString(kind_);
}

void DetectionContext::setStrategy(DetectionKind kind, bool resetBaseline) {
    if (kind != kind_ || !detector_) {
        kind_ = kind;
        detector_ = CreateDetector(kind);
    }
    if (resetBaseline) {
        baseline_.reset();
    }
    ++generation_;
}

void DetectionContext::setThreshold(double threshold) {
    threshold_ = threshold;
    ++generation_;
}

void DetectionContext::resetBaseline(FramePtr frame) {
    baseline_ = std::move(frame);
    ++generation_;
}

DetectionContext::Snapshot DetectionContext::snapshot() const {
    Snapshot snap;
    snap.detector = detector_;
    snap.baseline = baseline_;
    snap.threshold = threshold_;
    snap.generation = generation_;
    return snap;
}

bool DetectionContext::compare(const Frame& candidate, Verdict& out) const {
    return evaluate(snapshot(), candidate, out);
}

bool DetectionContext::evaluate(const Snapshot& snap, const Frame& candidate,
                                Verdict& out) {
    if (!snap.detector || !snap.baseline) {
        return false;
    }
    const double start = nowSeconds();
    out = snap.detector->compare(*snap.baseline, candidate, snap.threshold);
    out.elapsedMs = (nowSeconds() - start) * 1000.0;
    LOG_DEBUG("%s: changed=%d magnitude=%.2f threshold=%.2f (%.2f ms)",
              out.strategy.c_str(), out.changed ? 1 : 0, out.magnitude,
              snap.threshold, out.elapsedMs);
    return true;
}

}  // namespace roiwatch
