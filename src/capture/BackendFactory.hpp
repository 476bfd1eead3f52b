#pragma once

#include <memory>
#include <string>
#include <vector>

#include "capture/ICaptureBackend.hpp"
#include "platform/Capabilities.hpp"

namespace roiwatch {

enum class BackendKind { Auto, X11, Wlr, Portal, Wsl };

// Null when the backend was disabled at build time.
std::unique_ptr<ICaptureBackend> CreateBackend(
    BackendKind kind, const PlatformCapabilities& caps);

// Strategies worth trying on this platform, most capable first.
std::vector<BackendKind> RecommendedBackends(const PlatformCapabilities& caps);

std::string backendKindToString(BackendKind kind);
bool parseBackendKind(const std::string& text, BackendKind& out);

}  // namespace roiwatch
