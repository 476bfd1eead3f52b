#include "capture/BackendWlrScreencopy.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <wayland-client.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capture/Region.hpp"
#include "platform/Log.hpp"
#include "wlr-screencopy-unstable-v1-client-protocol.h"
#include "xdg-output-unstable-v1-client-protocol.h"

namespace roiwatch {

namespace {

using SteadyClock = std::chrono::steady_clock;

struct WlOutput {
    wl_output* handle = nullptr;
    zxdg_output_v1* xdg = nullptr;
    MonitorInfo info;

    Region rect() const {
        return Region{info.x, info.y, info.x + info.w, info.y + info.h};
    }
};

// Registry globals of one short-lived connection. Everything is released
// in the destructor.
class WlSession {
public:
    WlSession() = default;
    WlSession(const WlSession&) = delete;
    WlSession& operator=(const WlSession&) = delete;
    ~WlSession();

    bool connect();

    wl_display* display = nullptr;
    wl_registry* registry = nullptr;
    wl_shm* shm = nullptr;
    zwlr_screencopy_manager_v1* screencopy = nullptr;
    zxdg_output_manager_v1* xdgOutputs = nullptr;
    std::vector<std::unique_ptr<WlOutput>> outputs;

    std::vector<MonitorInfo> monitors() const {
        std::vector<MonitorInfo> out;
        out.reserve(outputs.size());
        for (const auto& output : outputs) {
            out.push_back(output->info);
        }
        return out;
    }
};

void onOutputGeometry(void* data, wl_output*, int32_t x, int32_t y, int32_t,
                      int32_t, int32_t, const char*, const char*, int32_t) {
    auto* output = static_cast<WlOutput*>(data);
    // Overridden by xdg-output logical coordinates when available.
    output->info.x = x;
    output->info.y = y;
}

void onOutputMode(void* data, wl_output*, uint32_t flags, int32_t width,
                  int32_t height, int32_t) {
    if ((flags & WL_OUTPUT_MODE_CURRENT) == 0) {
        return;
    }
    auto* output = static_cast<WlOutput*>(data);
    output->info.w = width;
    output->info.h = height;
}

void onOutputDone(void*, wl_output*) {}

void onOutputScale(void* data, wl_output*, int32_t factor) {
    static_cast<WlOutput*>(data)->info.scale = static_cast<float>(factor);
}

void onOutputName(void* data, wl_output*, const char* name) {
    if (name) {
        static_cast<WlOutput*>(data)->info.name = name;
    }
}

void onOutputDescription(void*, wl_output*, const char*) {}

const wl_output_listener kWlOutputListener = {
    onOutputGeometry, onOutputMode, onOutputDone,
    onOutputScale,    onOutputName, onOutputDescription};

void onLogicalPosition(void* data, zxdg_output_v1*, int32_t x, int32_t y) {
    auto* output = static_cast<WlOutput*>(data);
    output->info.x = x;
    output->info.y = y;
}

void onLogicalSize(void* data, zxdg_output_v1*, int32_t width,
                   int32_t height) {
    auto* output = static_cast<WlOutput*>(data);
    output->info.w = width;
    output->info.h = height;
}

void onXdgDone(void*, zxdg_output_v1*) {}

void onXdgName(void* data, zxdg_output_v1*, const char* name) {
    if (name) {
        static_cast<WlOutput*>(data)->info.name = name;
    }
}

void onXdgDescription(void*, zxdg_output_v1*, const char*) {}

const zxdg_output_v1_listener kXdgOutputListener = {
    onLogicalPosition, onLogicalSize, onXdgDone, onXdgName, onXdgDescription};

template <typename T>
T* bindGlobal(wl_registry* registry, uint32_t name,
              const wl_interface* iface, uint32_t offered, uint32_t wanted) {
    return static_cast<T*>(
        wl_registry_bind(registry, name, iface, std::min(offered, wanted)));
}

void onGlobal(void* data, wl_registry* registry, uint32_t name,
              const char* iface, uint32_t version) {
    auto* session = static_cast<WlSession*>(data);
    if (std::strcmp(iface, wl_shm_interface.name) == 0) {
        session->shm =
            bindGlobal<wl_shm>(registry, name, &wl_shm_interface, version, 1);
    } else if (std::strcmp(iface, wl_output_interface.name) == 0) {
        auto output = std::make_unique<WlOutput>();
        output->handle = bindGlobal<wl_output>(
            registry, name, &wl_output_interface, version, 4);
        output->info.name = "wl_output-" + std::to_string(name);
        wl_output_add_listener(output->handle, &kWlOutputListener,
                               output.get());
        session->outputs.push_back(std::move(output));
    } else if (std::strcmp(iface, zwlr_screencopy_manager_v1_interface.name) ==
               0) {
        session->screencopy = bindGlobal<zwlr_screencopy_manager_v1>(
            registry, name, &zwlr_screencopy_manager_v1_interface, version, 3);
    } else if (std::strcmp(iface, zxdg_output_manager_v1_interface.name) ==
               0) {
        session->xdgOutputs = bindGlobal<zxdg_output_manager_v1>(
            registry, name, &zxdg_output_manager_v1_interface, version, 3);
    }
}

void onGlobalRemove(void*, wl_registry*, uint32_t) {}

const wl_registry_listener kRegistryListener = {onGlobal, onGlobalRemove};

bool WlSession::connect() {
    display = wl_display_connect(nullptr);
    if (!display) {
        LOG_DEBUG("wlr: no Wayland display to connect to");
        return false;
    }
    registry = wl_display_get_registry(display);
    wl_registry_add_listener(registry, &kRegistryListener, this);
    if (wl_display_roundtrip(display) < 0) {
        return false;
    }
    if (xdgOutputs) {
        for (auto& output : outputs) {
            output->xdg = zxdg_output_manager_v1_get_xdg_output(
                xdgOutputs, output->handle);
            zxdg_output_v1_add_listener(output->xdg, &kXdgOutputListener,
                                        output.get());
        }
    }
    // Second roundtrip delivers wl_output modes and xdg-output geometry.
    if (wl_display_roundtrip(display) < 0) {
        return false;
    }
    if (!outputs.empty()) {
        outputs.front()->info.primary = true;
    }
    return true;
}

WlSession::~WlSession() {
    for (auto& output : outputs) {
        if (output->xdg) {
            zxdg_output_v1_destroy(output->xdg);
        }
        if (output->handle) {
            wl_output_destroy(output->handle);
        }
    }
    if (xdgOutputs) {
        zxdg_output_manager_v1_destroy(xdgOutputs);
    }
    if (screencopy) {
        zwlr_screencopy_manager_v1_destroy(screencopy);
    }
    if (shm) {
        wl_shm_destroy(shm);
    }
    if (registry) {
        wl_registry_destroy(registry);
    }
    if (display) {
        wl_display_disconnect(display);
    }
}

int openAnonymousShm(size_t size) {
    static std::atomic<unsigned> counter{0};
    for (int attempt = 0; attempt < 8; ++attempt) {
        std::string path = "/roiwatch-shm-" + std::to_string(getpid()) + "-" +
                           std::to_string(counter++);
        int fd = shm_open(path.c_str(), O_CREAT | O_RDWR | O_EXCL, 0600);
        if (fd < 0) {
            continue;
        }
        shm_unlink(path.c_str());
        if (ftruncate(fd, static_cast<off_t>(size)) == 0) {
            return fd;
        }
        close(fd);
        return -1;
    }
    return -1;
}

struct BufferSpec {
    uint32_t format = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t stride = 0;
};

// wl_buffer backed by an mmapped shm file.
class ShmBuffer {
public:
    ShmBuffer() = default;
    ShmBuffer(const ShmBuffer&) = delete;
    ShmBuffer& operator=(const ShmBuffer&) = delete;
    ~ShmBuffer() {
        if (buffer_) {
            wl_buffer_destroy(buffer_);
        }
        if (pixels_) {
            munmap(pixels_, size_);
        }
    }

    bool allocate(wl_shm* shm, const BufferSpec& spec) {
        size_ = static_cast<size_t>(spec.stride) * spec.height;
        int fd = openAnonymousShm(size_);
        if (fd < 0) {
            LOG_ERROR("wlr: cannot create shm file: %s", std::strerror(errno));
            return false;
        }
        void* mapped =
            mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
        if (mapped == MAP_FAILED) {
            LOG_ERROR("wlr: mmap of %zu bytes failed", size_);
            close(fd);
            return false;
        }
        pixels_ = mapped;
        wl_shm_pool* pool =
            wl_shm_create_pool(shm, fd, static_cast<int>(size_));
        buffer_ = wl_shm_pool_create_buffer(pool, 0,
                                            static_cast<int>(spec.width),
                                            static_cast<int>(spec.height),
                                            static_cast<int>(spec.stride),
                                            spec.format);
        wl_shm_pool_destroy(pool);
        close(fd);
        return buffer_ != nullptr;
    }

    wl_buffer* buffer() const {
        return buffer_;
    }
    const uint8_t* pixels() const {
        return static_cast<const uint8_t*>(pixels_);
    }

private:
    wl_buffer* buffer_ = nullptr;
    void* pixels_ = nullptr;
    size_t size_ = 0;
};

// State of one screencopy frame request.
struct CopyRequest {
    wl_shm* shm = nullptr;
    zwlr_screencopy_frame_v1* frame = nullptr;
    BufferSpec spec;
    ShmBuffer buffer;
    bool haveSpec = false;
    bool specsDone = false;
    bool copying = false;
    bool ready = false;
    bool failed = false;
    bool yInvert = false;

    ~CopyRequest() {
        if (frame) {
            zwlr_screencopy_frame_v1_destroy(frame);
        }
    }

    // Version 3 announces every buffer type before buffer_done; older
    // versions only send the shm one.
    void copyWhenNegotiated() {
        if (copying || !haveSpec) {
            return;
        }
        if (!specsDone && zwlr_screencopy_frame_v1_get_version(frame) >= 3) {
            return;
        }
        copying = true;
        if (!buffer.allocate(shm, spec)) {
            failed = true;
            return;
        }
        zwlr_screencopy_frame_v1_copy(frame, buffer.buffer());
    }
};

void onFrameBuffer(void* data, zwlr_screencopy_frame_v1*, uint32_t format,
                   uint32_t width, uint32_t height, uint32_t stride) {
    auto* req = static_cast<CopyRequest*>(data);
    req->spec = BufferSpec{format, width, height, stride};
    req->haveSpec = true;
    req->copyWhenNegotiated();
}

void onFrameFlags(void* data, zwlr_screencopy_frame_v1*, uint32_t flags) {
    static_cast<CopyRequest*>(data)->yInvert =
        (flags & ZWLR_SCREENCOPY_FRAME_V1_FLAGS_Y_INVERT) != 0;
}

void onFrameReady(void* data, zwlr_screencopy_frame_v1*, uint32_t, uint32_t,
                  uint32_t) {
    static_cast<CopyRequest*>(data)->ready = true;
}

void onFrameFailed(void* data, zwlr_screencopy_frame_v1*) {
    static_cast<CopyRequest*>(data)->failed = true;
}

void onFrameDamage(void*, zwlr_screencopy_frame_v1*, uint32_t, uint32_t,
                   uint32_t, uint32_t) {}

void onFrameDmabuf(void*, zwlr_screencopy_frame_v1*, uint32_t, uint32_t,
                   uint32_t) {}

void onFrameBufferDone(void* data, zwlr_screencopy_frame_v1*) {
    auto* req = static_cast<CopyRequest*>(data);
    req->specsDone = true;
    req->copyWhenNegotiated();
}

const zwlr_screencopy_frame_v1_listener kCopyListener = {
    onFrameBuffer, onFrameFlags,  onFrameReady,     onFrameFailed,
    onFrameDamage, onFrameDmabuf, onFrameBufferDone};

// One read/dispatch cycle bounded by `deadline`. Returns false on timeout
// or a broken connection.
bool dispatchBefore(wl_display* display, SteadyClock::time_point deadline) {
    while (wl_display_prepare_read(display) != 0) {
        if (wl_display_dispatch_pending(display) < 0) {
            return false;
        }
    }
    wl_display_flush(display);
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now());
    if (remaining.count() <= 0) {
        wl_display_cancel_read(display);
        return false;
    }
    pollfd pfd{wl_display_get_fd(display), POLLIN, 0};
    int rc = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc <= 0) {
        wl_display_cancel_read(display);
        return rc < 0 && errno == EINTR;
    }
    if (wl_display_read_events(display) != 0) {
        return false;
    }
    return wl_display_dispatch_pending(display) >= 0;
}

// Output sharing the largest area with `region`, or null.
const WlOutput* pickOutput(const WlSession& session, const Region& region) {
    const WlOutput* best = nullptr;
    long bestArea = 0;
    for (const auto& output : session.outputs) {
        auto overlap = intersectRegion(region, output->rect());
        if (!overlap) {
            continue;
        }
        long area = static_cast<long>(overlap->width()) * overlap->height();
        if (area > bestArea) {
            bestArea = area;
            best = output.get();
        }
    }
    return best;
}

// Shm pixels to RGBA at `outW`x`outH`. The compositor hands out buffers in
// physical pixels, so scaled outputs are resampled to logical size.
bool toRgba(const CopyRequest& req, int outW, int outH, ImageRGBA& out) {
    const uint32_t format = req.spec.format;
    if (format != WL_SHM_FORMAT_ARGB8888 && format != WL_SHM_FORMAT_XRGB8888) {
        return false;
    }
    const int srcW = static_cast<int>(req.spec.width);
    const int srcH = static_cast<int>(req.spec.height);
    if (srcW <= 0 || srcH <= 0 || outW <= 0 || outH <= 0) {
        return false;
    }
    const bool opaque = format == WL_SHM_FORMAT_XRGB8888;
    out.w = outW;
    out.h = outH;
    out.rgba.resize(static_cast<size_t>(outW) * static_cast<size_t>(outH) *
                    4u);
    uint8_t* dst = out.rgba.data();
    for (int y = 0; y < outH; ++y) {
        int sy = static_cast<int>(static_cast<long>(y) * srcH / outH);
        if (req.yInvert) {
            sy = srcH - 1 - sy;
        }
        const auto* row = reinterpret_cast<const uint32_t*>(
            req.buffer.pixels() + static_cast<size_t>(req.spec.stride) * sy);
        for (int x = 0; x < outW; ++x) {
            const uint32_t px = row[static_cast<long>(x) * srcW / outW];
            *dst++ = static_cast<uint8_t>(px >> 16);
            *dst++ = static_cast<uint8_t>(px >> 8);
            *dst++ = static_cast<uint8_t>(px);
            *dst++ = opaque ? 255 : static_cast<uint8_t>(px >> 24);
        }
    }
    return true;
}

}  // namespace

class WlrScreencopyBackend final : public ICaptureBackend {
public:
    std::string name() const override {
        return "wlr-screencopy";
    }

    bool isAvailable() const override {
        if (!std::getenv("WAYLAND_DISPLAY")) {
            return false;
        }
        WlSession session;
        return session.connect() && session.screencopy && session.shm;
    }

    std::vector<MonitorInfo> listMonitors() override {
        WlSession session;
        if (!session.connect()) {
            return {};
        }
        return session.monitors();
    }

    CaptureResult captureOnce(const std::optional<Region>& region,
                              std::chrono::milliseconds timeout) override {
        const auto deadline = SteadyClock::now() + timeout;
        CaptureResult result;
        WlSession session;
        if (!session.connect()) {
            result.error = "failed to connect to Wayland display";
            return result;
        }
        if (!session.screencopy || !session.shm) {
            result.error = "compositor lacks wlr-screencopy or wl_shm";
            return result;
        }
        result.monitors = session.monitors();
        result.displayBounds = boundsOfMonitors(result.monitors);

        const Region wanted = region ? *region : result.displayBounds;
        const WlOutput* output = pickOutput(session, wanted);
        if (!output) {
            result.error = "region " + regionToString(wanted) +
                           " does not overlap any output";
            return result;
        }
        // Regions spanning several outputs are clipped to the best one.
        const Region area = *intersectRegion(wanted, output->rect());
        LOG_DEBUG("wlr: capturing %s from %s", regionToString(area).c_str(),
                  output->info.name.c_str());

        CopyRequest req;
        req.shm = session.shm;
        req.frame = zwlr_screencopy_manager_v1_capture_output_region(
            session.screencopy, 0, output->handle, area.left - output->info.x,
            area.top - output->info.y, area.width(), area.height());
        zwlr_screencopy_frame_v1_add_listener(req.frame, &kCopyListener, &req);

        while (!req.ready && !req.failed) {
            if (!dispatchBefore(session.display, deadline)) {
                result.error = "timed out waiting for compositor frame";
                return result;
            }
        }
        if (req.failed || !req.buffer.pixels()) {
            result.error = "compositor reported capture failure";
            return result;
        }
        if (!toRgba(req, area.width(), area.height(), result.image)) {
            result.image = ImageRGBA{};
            result.error =
                "unsupported shm format " + std::to_string(req.spec.format);
            return result;
        }
        result.area = area;
        return result;
    }
};

std::unique_ptr<ICaptureBackend> CreateBackendWlrScreencopy() {
    return std::make_unique<WlrScreencopyBackend>();
}

}  // namespace roiwatch
