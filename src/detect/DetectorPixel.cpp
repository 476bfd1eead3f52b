#include "detect/DetectorPixel.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#include "capture/ImageCodec.hpp"
#include "platform/Log.hpp"

namespace roiwatch {

namespace {

// Mean absolute RGB difference over a grid of cell centres, scaled to
// 0-100. Both images must have the same size.
double sampledDifference(const ImageRGBA& a, const ImageRGBA& b) {
    const int cols = std::min(kPixelGrid, a.w);
    const int rows = std::min(kPixelGrid, a.h);
    unsigned long long total = 0;
    for (int gy = 0; gy < rows; ++gy) {
        const int y = static_cast<int>((2L * gy + 1) * a.h / (2L * rows));
        for (int gx = 0; gx < cols; ++gx) {
            const int x = static_cast<int>((2L * gx + 1) * a.w / (2L * cols));
            const size_t idx = (static_cast<size_t>(y) *
                                    static_cast<size_t>(a.w) +
                                static_cast<size_t>(x)) *
                               4u;
            for (size_t c = 0; c < 3; ++c) {
                total += static_cast<unsigned long long>(
                    std::abs(static_cast<int>(a.rgba[idx + c]) -
                             static_cast<int>(b.rgba[idx + c])));
            }
        }
    }
    const double samples = static_cast<double>(cols) * rows * 3.0;
    return static_cast<double>(total) / samples / 255.0 * 100.0;
}

}  // namespace

class PixelDetector final : public IChangeDetector {
public:
    DetectionKind kind() const override {
        return DetectionKind::Pixel;
    }

    std::string name() const override {
        return "pixel";
    }

    Verdict compare(const Frame& baseline, const Frame& candidate,
                    double threshold) const override {
        if (baseline.width != candidate.width ||
            baseline.height != candidate.height) {
            return makeVerdict(name(), true, 100.0);
        }

        ImageRGBA base;
        ImageRGBA cand;
        std::string err;
        if (!decodeImage(baseline.bytes.data(), baseline.bytes.size(), base,
                         &err) ||
            !decodeImage(candidate.bytes.data(), candidate.bytes.size(), cand,
                         &err)) {
            LOG_WARN("pixel: %s, treating frame as changed", err.c_str());
            return makeVerdict(name(), true, 100.0);
        }
        if (base.w != cand.w || base.h != cand.h) {
            return makeVerdict(name(), true, 100.0);
        }

        const double magnitude = sampledDifference(base, cand);
        return makeVerdict(name(), magnitude > threshold, magnitude);
    }
};

std::unique_ptr<IChangeDetector> CreateDetectorPixel() {
    return std::make_unique<PixelDetector>();
}

}  // namespace roiwatch
