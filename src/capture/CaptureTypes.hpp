#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "platform/Time.hpp"

namespace roiwatch {

struct ImageRGBA {
    int w = 0;
    int h = 0;
    std::vector<std::uint8_t> rgba;
};

// Display-space rectangle, right/bottom exclusive.
struct Region {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const {
        return right - left;
    }
    int height() const {
        return bottom - top;
    }
    bool operator==(const Region& o) const {
        return left == o.left && top == o.top && right == o.right &&
               bottom == o.bottom;
    }
    bool operator!=(const Region& o) const {
        return !(*this == o);
    }
};

struct MonitorInfo {
    std::string name;
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
    float scale = 1.0f;
    bool primary = false;
};

// What a single strategy attempt produced. `area` is the part of the
// display covered by `image`; `displayBounds` is the whole virtual display
// as seen during the attempt.
struct CaptureResult {
    ImageRGBA image;
    Region area;
    Region displayBounds;
    std::vector<MonitorInfo> monitors;
    std::string error;
};

// An encoded (PNG) capture. Never mutated once built; shared between the
// monitor, the detection context and event subscribers.
struct Frame {
    std::vector<std::uint8_t> bytes;
    int width = 0;
    int height = 0;
    Timestamp capturedAt{};
    std::string strategy;
    bool success = false;
    bool clamped = false;
    Region region;
};

using FramePtr = std::shared_ptr<const Frame>;

}  // namespace roiwatch
