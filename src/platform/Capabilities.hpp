#pragma once

#include <string>

namespace roiwatch {

// What the host environment offers for screen capture. Detected once at
// startup and handed to the capture chain, so tests can describe any
// platform they like.
struct PlatformCapabilities {
    bool hasX11Display = false;
    bool hasWaylandDisplay = false;
    bool hasSessionBus = false;
    bool isWsl = false;
    std::string powershellPath = "powershell.exe";
};

PlatformCapabilities DetectPlatformCapabilities();

std::string describeCapabilities(const PlatformCapabilities& caps);

}  // namespace roiwatch
