#include "detect/DetectorSize.hpp"

#include <algorithm>
#include <cstdlib>

namespace roiwatch {

class SizeDetector final : public IChangeDetector {
public:
    DetectionKind kind() const override {
        return DetectionKind::Size;
    }

    std::string name() const override {
        return "size";
    }

    Verdict compare(const Frame& baseline, const Frame& candidate,
                    double threshold) const override {
        const double base = static_cast<double>(baseline.bytes.size());
        const double cand = static_cast<double>(candidate.bytes.size());
        const double percent =
            std::abs(cand - base) / std::max(1.0, base) * 100.0;
        return makeVerdict(name(), percent > threshold, percent);
    }
};

std::unique_ptr<IChangeDetector> CreateDetectorSize() {
    return std::make_unique<SizeDetector>();
}

}  // namespace roiwatch
