#include "detect/DetectorHash.hpp"

#include <xxhash.h>

namespace roiwatch {

std::uint64_t hashPayload(const std::vector<std::uint8_t>& bytes) {
    return static_cast<std::uint64_t>(XXH3_64bits(bytes.data(), bytes.size()));
}

class HashDetector final : public IChangeDetector {
public:
    DetectionKind kind() const override {
        return DetectionKind::Hash;
    }

    std::string name() const override {
        return "hash";
    }

    Verdict compare(const Frame& baseline, const Frame& candidate,
                    double threshold) const override {
        (void)threshold;
        const bool changed =
            hashPayload(baseline.bytes) != hashPayload(candidate.bytes);
        return makeVerdict(name(), changed, changed ? 100.0 : 0.0);
    }
};

std::unique_ptr<IChangeDetector> CreateDetectorHash() {
    return std::make_unique<HashDetector>();
}

}  // namespace roiwatch
