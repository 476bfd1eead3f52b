#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"

namespace roiwatch {

class ICaptureBackend {
public:
    virtual ~ICaptureBackend() = default;
    virtual std::string name() const = 0;
    virtual bool isAvailable() const = 0;
    virtual std::vector<MonitorInfo> listMonitors() = 0;
    // `region` is a hint: a backend may return a larger area and leave the
    // crop to the caller. On failure `error` is set and `image` is empty.
    virtual CaptureResult captureOnce(const std::optional<Region>& region,
                                      std::chrono::milliseconds timeout) = 0;
};

}  // namespace roiwatch
