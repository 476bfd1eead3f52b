#include "capture/BackendX11.hpp"

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>

#include <cstdint>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>

#include "capture/Region.hpp"
#include "platform/Log.hpp"

namespace roiwatch {

namespace {

struct DisplayCloser {
    void operator()(Display* d) const {
        XCloseDisplay(d);
    }
};
struct ImageDestroyer {
    void operator()(XImage* img) const {
        XDestroyImage(img);
    }
};
struct ResourcesFree {
    void operator()(XRRScreenResources* res) const {
        XRRFreeScreenResources(res);
    }
};
using DisplayPtr = std::unique_ptr<Display, DisplayCloser>;
using XImagePtr = std::unique_ptr<XImage, ImageDestroyer>;
using ResourcesPtr = std::unique_ptr<XRRScreenResources, ResourcesFree>;

DisplayPtr openDisplay() {
    return DisplayPtr(XOpenDisplay(nullptr));
}

// Xlib's default error handler exits the process. Errors raised while
// grabbing are recorded here instead; the handler is process-wide, so
// grabs are serialized.
std::mutex g_grabMutex;
int g_grabError = 0;

int recordGrabError(Display*, XErrorEvent* event) {
    g_grabError = event ? event->error_code : -1;
    return 0;
}

XImagePtr grabRoot(Display* display, const Region& area) {
    std::lock_guard<std::mutex> lock(g_grabMutex);
    g_grabError = 0;
    auto previous = XSetErrorHandler(recordGrabError);
    XImagePtr image(XGetImage(display, DefaultRootWindow(display), area.left,
                              area.top, static_cast<unsigned>(area.width()),
                              static_cast<unsigned>(area.height()), AllPlanes,
                              ZPixmap));
    XSync(display, False);
    XSetErrorHandler(previous);
    if (g_grabError != 0) {
        LOG_DEBUG("X11: XGetImage raised error code %d", g_grabError);
        image.reset();
    }
    return image;
}

// Extracts one colour channel described by an XImage mask and widens it
// to 8 bits.
class Channel {
public:
    explicit Channel(unsigned long mask)
        : mask_(mask),
          shift_(mask ? __builtin_ctzl(mask) : 0),
          max_(mask >> shift_) {}

    std::uint8_t operator()(unsigned long pixel) const {
        if (max_ == 0) {
            return 0;
        }
        return static_cast<std::uint8_t>(((pixel & mask_) >> shift_) * 255ul /
                                         max_);
    }

private:
    unsigned long mask_;
    int shift_;
    unsigned long max_;
};

void toRgba(XImage* image, ImageRGBA& out) {
    const Channel red(image->red_mask);
    const Channel green(image->green_mask);
    const Channel blue(image->blue_mask);
    out.w = image->width;
    out.h = image->height;
    out.rgba.resize(static_cast<size_t>(out.w) * static_cast<size_t>(out.h) *
                    4u);
    std::uint8_t* dst = out.rgba.data();
    for (int y = 0; y < out.h; ++y) {
        for (int x = 0; x < out.w; ++x) {
            const unsigned long px = XGetPixel(image, x, y);
            *dst++ = red(px);
            *dst++ = green(px);
            *dst++ = blue(px);
            *dst++ = 255;
        }
    }
}

// Connected RandR outputs with an active CRTC.
std::vector<MonitorInfo> queryOutputs(Display* display) {
    std::vector<MonitorInfo> monitors;
    const Window root = DefaultRootWindow(display);
    ResourcesPtr res(XRRGetScreenResourcesCurrent(display, root));
    if (!res) {
        LOG_WARN("X11: RandR screen resources unavailable");
        return monitors;
    }
    const RROutput primary = XRRGetOutputPrimary(display, root);
    for (int i = 0; i < res->noutput; ++i) {
        XRROutputInfo* out =
            XRRGetOutputInfo(display, res.get(), res->outputs[i]);
        if (!out) {
            continue;
        }
        XRRCrtcInfo* crtc = nullptr;
        if (out->connection == RR_Connected && out->crtc != 0) {
            crtc = XRRGetCrtcInfo(display, res.get(), out->crtc);
        }
        if (crtc) {
            MonitorInfo info;
            info.name.assign(out->name, static_cast<size_t>(out->nameLen));
            info.x = crtc->x;
            info.y = crtc->y;
            info.w = static_cast<int>(crtc->width);
            info.h = static_cast<int>(crtc->height);
            info.primary = res->outputs[i] == primary;
            monitors.push_back(info);
            XRRFreeCrtcInfo(crtc);
        }
        XRRFreeOutputInfo(out);
    }
    return monitors;
}

}  // namespace

class X11CaptureBackend final : public ICaptureBackend {
public:
    std::string name() const override {
        return "x11";
    }

    bool isAvailable() const override {
        return std::getenv("DISPLAY") != nullptr && openDisplay() != nullptr;
    }

    std::vector<MonitorInfo> listMonitors() override {
        DisplayPtr display = openDisplay();
        if (!display) {
            LOG_WARN("X11: cannot open display to list monitors");
            return {};
        }
        return queryOutputs(display.get());
    }

    // XGetImage is a synchronous round trip bounded by the server, so the
    // timeout is not consulted.
    CaptureResult captureOnce(const std::optional<Region>& region,
                              std::chrono::milliseconds) override {
        CaptureResult result;
        DisplayPtr display = openDisplay();
        if (!display) {
            result.error = "cannot open X display";
            return result;
        }
        const int screen = DefaultScreen(display.get());
        result.displayBounds =
            Region{0, 0, DisplayWidth(display.get(), screen),
                   DisplayHeight(display.get(), screen)};
        result.monitors = queryOutputs(display.get());

        Region area = result.displayBounds;
        if (region) {
            auto clipped = intersectRegion(*region, result.displayBounds);
            if (!clipped) {
                result.error = "region " + regionToString(*region) +
                               " lies outside the X screen";
                return result;
            }
            area = *clipped;
        }

        XImagePtr image = grabRoot(display.get(), area);
        if (!image) {
            result.error = "XGetImage failed for " + regionToString(area);
            return result;
        }
        toRgba(image.get(), result.image);
        result.area = area;
        return result;
    }
};

std::unique_ptr<ICaptureBackend> CreateBackendX11() {
    return std::make_unique<X11CaptureBackend>();
}

}  // namespace roiwatch
