#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "detect/IChangeDetector.hpp"

namespace roiwatch {

// Exact-match comparison on an XXH3 hash of the payload. The threshold is
// ignored and the magnitude is 0 or 100.
std::unique_ptr<IChangeDetector> CreateDetectorHash();

std::uint64_t hashPayload(const std::vector<std::uint8_t>& bytes);

}  // namespace roiwatch
