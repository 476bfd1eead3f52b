#pragma once

#include <memory>

#include "detect/IChangeDetector.hpp"

namespace roiwatch {

// Samples at most kPixelGrid x kPixelGrid positions per frame.
constexpr int kPixelGrid = 32;

std::unique_ptr<IChangeDetector> CreateDetectorPixel();

}  // namespace roiwatch
