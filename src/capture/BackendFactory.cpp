#include "capture/BackendFactory.hpp"

#include <memory>

#include "capture/BackendWslPowerShell.hpp"
#include "platform/Log.hpp"

#if defined(ROIWATCH_HAS_X11)
#include "capture/BackendX11.hpp"
#endif
#if defined(ROIWATCH_HAS_WAYLAND)
#include "capture/BackendWlrScreencopy.hpp"
#endif
#if defined(ROIWATCH_HAS_PORTAL)
#include "capture/BackendPortalScreenshot.hpp"
#endif

namespace roiwatch {

namespace {

std::unique_ptr<ICaptureBackend> createX11() {
#if defined(ROIWATCH_HAS_X11)
    return CreateBackendX11();
#else
    return nullptr;
#endif
}

std::unique_ptr<ICaptureBackend> createWlr() {
#if defined(ROIWATCH_HAS_WAYLAND)
    return CreateBackendWlrScreencopy();
#else
    return nullptr;
#endif
}

std::unique_ptr<ICaptureBackend> createPortal() {
#if defined(ROIWATCH_HAS_PORTAL)
    return CreateBackendPortalScreenshot();
#else
    return nullptr;
#endif
}

}  // namespace

std::unique_ptr<ICaptureBackend> CreateBackend(
    BackendKind kind, const PlatformCapabilities& caps) {
    std::unique_ptr<ICaptureBackend> backend;
    switch (kind) {
        case BackendKind::Auto:
            LOG_ERROR("auto is a chain, not a single backend");
            return nullptr;
        case BackendKind::X11:
            backend = createX11();
            break;
        case BackendKind::Wlr:
            backend = createWlr();
            break;
        case BackendKind::Portal:
            backend = createPortal();
            break;
        case BackendKind::Wsl:
            backend = CreateBackendWslPowerShell(caps.powershellPath);
            break;
    }
    if (!backend) {
        LOG_DEBUG("%s backend disabled at build time",
                  backendKindToString(kind).c_str());
    }
    return backend;
}

std::vector<BackendKind> RecommendedBackends(const PlatformCapabilities& caps) {
    std::vector<BackendKind> order;
    if (caps.isWsl) {
        order.push_back(BackendKind::Wsl);
    }
    if (caps.hasWaylandDisplay) {
        order.push_back(BackendKind::Wlr);
        if (caps.hasSessionBus) {
            order.push_back(BackendKind::Portal);
        }
    }
    // Plain X11, or XWayland as the last resort under a compositor.
    if (caps.hasX11Display) {
        order.push_back(BackendKind::X11);
    }
    return order;
}

std::string backendKindToString(BackendKind kind) {
    switch (kind) {
        case BackendKind::Auto:
            return "auto";
        case BackendKind::X11:
            return "x11";
        case BackendKind::Wlr:
            return "wlr";
        case BackendKind::Portal:
            return "portal";
        case BackendKind::Wsl:
            return "wsl";
    }
    return "auto";
}

bool parseBackendKind(const std::string& text, BackendKind& out) {
    if (text == "auto") {
        out = BackendKind::Auto;
    } else if (text == "x11") {
        out = BackendKind::X11;
    } else if (text == "wlr") {
        out = BackendKind::Wlr;
    } else if (text == "portal") {
        out = BackendKind::Portal;
    } else if (text == "wsl") {
        out = BackendKind::Wsl;
    } else {
        return false;
    }
    return true;
}

}  // namespace roiwatch
