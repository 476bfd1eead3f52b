#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "capture/CaptureChain.hpp"
#include "capture/CaptureTypes.hpp"
#include "capture/ICaptureBackend.hpp"
#include "capture/ImageCodec.hpp"
#include "capture/Region.hpp"

namespace roiwatch {

struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

constexpr Rgba kBlack{0, 0, 0, 255};
constexpr Rgba kWhite{255, 255, 255, 255};
constexpr Rgba kGrey{128, 128, 128, 255};

inline const Region kFakeDisplay{0, 0, 200, 150};

inline ImageRGBA solidImage(int w, int h, Rgba color) {
    ImageRGBA img;
    img.w = w;
    img.h = h;
    img.rgba.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 4u);
    for (size_t i = 0; i < img.rgba.size(); i += 4) {
        img.rgba[i + 0] = color.r;
        img.rgba[i + 1] = color.g;
        img.rgba[i + 2] = color.b;
        img.rgba[i + 3] = color.a;
    }
    return img;
}

inline Frame pngFrame(const ImageRGBA& img) {
    Frame frame;
    std::string err;
    encodePng(img, frame.bytes, &err);
    frame.width = img.w;
    frame.height = img.h;
    frame.success = true;
    frame.strategy = "test";
    frame.region = Region{0, 0, img.w, img.h};
    return frame;
}

inline Frame rawFrame(size_t size, std::uint8_t fill = 0) {
    Frame frame;
    frame.bytes.assign(size, fill);
    frame.width = 10;
    frame.height = 10;
    frame.success = true;
    return frame;
}

// Scripted capture strategy over a virtual display of solid colour.
// Steps queued with failNext()/malformedNext() run first; after that every
// capture uses the persistent mode.
class FakeBackend : public ICaptureBackend {
public:
    explicit FakeBackend(std::string name, Region bounds = kFakeDisplay)
        : name_(std::move(name)), bounds_(bounds) {}

    std::string name() const override {
        return name_;
    }

    bool isAvailable() const override {
        return true;
    }

    std::vector<MonitorInfo> listMonitors() override {
        MonitorInfo mon;
        mon.name = name_ + "-0";
        mon.x = bounds_.left;
        mon.y = bounds_.top;
        mon.w = bounds_.width();
        mon.h = bounds_.height();
        mon.primary = true;
        return {mon};
    }

    CaptureResult captureOnce(const std::optional<Region>& region,
                              std::chrono::milliseconds) override {
        std::chrono::milliseconds delay{0};
        Step step;
        Rgba color;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++attempts_;
            if (!script_.empty()) {
                step = script_.front();
                script_.pop_front();
            } else {
                step = mode_;
            }
            color = color_;
            delay = delay_;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        CaptureResult result;
        result.displayBounds = bounds_;
        result.monitors = listMonitors();
        if (step.kind == StepKind::Fail) {
            result.error = step.message;
            return result;
        }
        Region area = bounds_;
        if (region) {
            auto clipped = intersectRegion(*region, bounds_);
            if (!clipped) {
                result.error = "region outside display";
                return result;
            }
            area = *clipped;
        }
        result.area = area;
        if (step.kind == StepKind::Malformed) {
            return result;
        }
        result.image = solidImage(area.width(), area.height(), color);
        return result;
    }

    void setColor(Rgba color) {
        std::lock_guard<std::mutex> lock(mutex_);
        color_ = color;
    }

    void setFailing(bool failing,
                    const std::string& message = "fake failure") {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_ = failing ? Step{StepKind::Fail, message} : Step{};
    }

    void failNext(int count, const std::string& message = "fake failure") {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < count; ++i) {
            script_.push_back(Step{StepKind::Fail, message});
        }
    }

    void malformedNext() {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(Step{StepKind::Malformed, {}});
    }

    void setDelay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
    }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

private:
    enum class StepKind { Ok, Fail, Malformed };
    struct Step {
        StepKind kind = StepKind::Ok;
        std::string message;
    };

    std::string name_;
    Region bounds_;
    mutable std::mutex mutex_;
    std::deque<Step> script_;
    Step mode_;
    Rgba color_ = kBlack;
    std::chrono::milliseconds delay_{0};
    int attempts_ = 0;
};

// Adds a fake to `strategies` and returns a handle that stays valid for the
// lifetime of the chain built from them.
inline FakeBackend* addFake(std::vector<CaptureStrategy>& strategies,
                            const std::string& name,
                            Region bounds = kFakeDisplay) {
    auto fake = std::make_unique<FakeBackend>(name, bounds);
    FakeBackend* handle = fake.get();
    strategies.push_back(CaptureStrategy{BackendKind::Auto, std::move(fake)});
    return handle;
}

// Polls `pred` until it holds or `timeout` expires.
inline bool waitFor(const std::function<bool()>& pred,
                    std::chrono::milliseconds timeout =
                        std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}  // namespace roiwatch
