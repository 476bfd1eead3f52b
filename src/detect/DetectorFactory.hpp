#pragma once

#include <memory>
#include <string>

#include "detect/IChangeDetector.hpp"

namespace roiwatch {

std::unique_ptr<IChangeDetector> CreateDetector(DetectionKind kind);

std::string detectionKindToString(DetectionKind kind);
bool parseDetectionKind(const std::string& text, DetectionKind& out);
// One line per strategy for --list-strategies.
std::string describeDetectionKinds();

}  // namespace roiwatch
