#pragma once

#include <memory>

#include "detect/IChangeDetector.hpp"

namespace roiwatch {

// Relative change of the encoded payload size, in percent. Cheap, but blind
// to edits that keep the size and noisy under re-encoding; both are
// accepted.
std::unique_ptr<IChangeDetector> CreateDetectorSize();

}  // namespace roiwatch
