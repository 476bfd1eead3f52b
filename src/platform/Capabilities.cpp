#include "platform/Capabilities.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "platform/FileUtil.hpp"

namespace roiwatch {

namespace {

bool envSet(const char* name) {
    const char* value = std::getenv(name);
    return value && value[0] != '\0';
}

bool kernelLooksLikeWsl() {
    std::string version = readTextFile("/proc/version");
    std::transform(version.begin(), version.end(), version.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return version.find("microsoft") != std::string::npos ||
           version.find("wsl") != std::string::npos;
}

}  // namespace

PlatformCapabilities DetectPlatformCapabilities() {
    PlatformCapabilities caps;
    caps.hasX11Display = envSet("DISPLAY");
    caps.hasWaylandDisplay = envSet("WAYLAND_DISPLAY");
    caps.hasSessionBus = envSet("DBUS_SESSION_BUS_ADDRESS");
    caps.isWsl = envSet("WSL_DISTRO_NAME") || kernelLooksLikeWsl();
    if (envSet("ROIWATCH_POWERSHELL")) {
        caps.powershellPath = std::getenv("ROIWATCH_POWERSHELL");
    }
    return caps;
}

std::string describeCapabilities(const PlatformCapabilities& caps) {
    std::string out;
    out += "x11=";
    out += caps.hasX11Display ? "yes" : "no";
    out += " wayland=";
    out += caps.hasWaylandDisplay ? "yes" : "no";
    out += " session-bus=";
    out += caps.hasSessionBus ? "yes" : "no";
    out += " wsl=";
    out += caps.isWsl ? "yes" : "no";
    return out;
}

}  // namespace roiwatch
