#pragma once

#include <optional>
#include <string>

#include "capture/BackendFactory.hpp"
#include "capture/CaptureTypes.hpp"
#include "detect/IChangeDetector.hpp"

namespace roiwatch {

struct CliOptions {
    Region region{100, 100, 800, 800};
    DetectionKind strategy = DetectionKind::Size;
    double threshold = 20.0;
    int intervalMs = 500;
    BackendKind backend = BackendKind::Auto;
    int captureTimeoutMs = 5000;
    int durationSec = 0;
    std::optional<std::string> outputDir;
    std::optional<std::string> forceCapturePath;
    bool listMonitors = false;
    bool listStrategies = false;
    bool debug = false;
    bool help = false;
};

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err);
void printUsage(const char* exe);

}  // namespace roiwatch
