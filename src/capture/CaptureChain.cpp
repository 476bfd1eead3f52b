#include "capture/CaptureChain.hpp"

#include <utility>

#include "capture/ImageCodec.hpp"
#include "capture/Region.hpp"
#include "platform/Log.hpp"

namespace roiwatch {

namespace {

// Failures of the memoized strategy tolerated before re-probing the list.
constexpr int kPreferredFailureLimit = 2;

std::vector<CaptureStrategy> strategiesFor(
    const std::vector<BackendKind>& kinds, const PlatformCapabilities& caps) {
    std::vector<CaptureStrategy> out;
    for (BackendKind kind : kinds) {
        auto backend = CreateBackend(kind, caps);
        if (!backend) {
            continue;
        }
        out.push_back(CaptureStrategy{kind, std::move(backend)});
    }
    return out;
}

std::string joinFailures(const std::vector<StrategyFailure>& failures) {
    std::string out;
    for (const auto& f : failures) {
        if (!out.empty()) {
            out += "; ";
        }
        out += f.strategy + ": " + f.message;
    }
    return out;
}

}  // namespace

CaptureChain::CaptureChain(const PlatformCapabilities& caps,
                           CaptureChainOptions options)
    : CaptureChain(strategiesFor(RecommendedBackends(caps), caps), options) {}

CaptureChain::CaptureChain(const PlatformCapabilities& caps,
                           BackendKind pinned, CaptureChainOptions options)
    : CaptureChain(pinned == BackendKind::Auto
                       ? strategiesFor(RecommendedBackends(caps), caps)
                       : strategiesFor({pinned}, caps),
                   options) {}

CaptureChain::CaptureChain(std::vector<CaptureStrategy> strategies,
                           CaptureChainOptions options)
    : options_(options) {
    for (auto& strategy : strategies) {
        if (!strategy.backend) {
            continue;
        }
        LOG_DEBUG("capture chain [%zu]: %s", entries_.size(),
                  strategy.backend->name().c_str());
        Entry entry;
        entry.strategy = std::move(strategy);
        entries_.push_back(std::move(entry));
    }
    if (entries_.empty()) {
        LOG_WARN("capture chain is empty: no strategy fits this platform");
    }
}

bool CaptureChain::capture(const std::optional<Region>& region, Frame& out,
                           CaptureError* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        if (err) {
            err->kind = CaptureErrorKind::NoStrategies;
            err->message = "no capture strategy available";
            err->failures.clear();
        }
        return false;
    }

    std::vector<StrategyFailure> failures;
    int skip = -1;

    if (preferred_ >= 0) {
        std::string failure;
        switch (attempt(static_cast<size_t>(preferred_), region, out,
                        failure)) {
            case AttemptStatus::Ok:
                preferredFailures_ = 0;
                return true;
            case AttemptStatus::InvalidRegion:
                if (err) {
                    err->kind = CaptureErrorKind::InvalidRegion;
                    err->message = failure;
                    err->failures.clear();
                }
                return false;
            case AttemptStatus::Failed:
                break;
        }
        const std::string name =
            entries_[static_cast<size_t>(preferred_)].strategy.backend->name();
        failures.push_back(StrategyFailure{name, failure});
        if (++preferredFailures_ < kPreferredFailureLimit) {
            if (err) {
                err->kind = CaptureErrorKind::StrategyFailed;
                err->message = joinFailures(failures);
                err->failures = failures;
            }
            return false;
        }
        LOG_WARN("preferred capture strategy %s failed %d times, re-probing",
                 name.c_str(), preferredFailures_);
        skip = preferred_;
        preferred_ = -1;
        preferredFailures_ = 0;
    }

    for (size_t i = 0; i < entries_.size(); ++i) {
        if (static_cast<int>(i) == skip) {
            continue;
        }
        std::string failure;
        AttemptStatus status = attempt(i, region, out, failure);
        if (status == AttemptStatus::Ok) {
            preferred_ = static_cast<int>(i);
            preferredFailures_ = 0;
            LOG_DEBUG("capture strategy %s selected",
                      entries_[i].strategy.backend->name().c_str());
            return true;
        }
        if (status == AttemptStatus::InvalidRegion) {
            if (err) {
                err->kind = CaptureErrorKind::InvalidRegion;
                err->message = failure;
                err->failures.clear();
            }
            return false;
        }
        failures.push_back(
            StrategyFailure{entries_[i].strategy.backend->name(), failure});
    }

    if (err) {
        err->kind = CaptureErrorKind::StrategyFailed;
        err->message =
            "all capture strategies failed: " + joinFailures(failures);
        err->failures = failures;
    }
    return false;
}

CaptureChain::AttemptStatus CaptureChain::attempt(
    size_t index, const std::optional<Region>& region, Frame& out,
    std::string& failure) {
    Entry& entry = entries_[index];
    ICaptureBackend& backend = *entry.strategy.backend;
    ++entry.attempts;

    auto fail = [&](const std::string& why) {
        ++entry.failures;
        entry.lastError = why;
        failure = why;
        LOG_DEBUG("capture strategy %s failed: %s", backend.name().c_str(),
                  why.c_str());
        return AttemptStatus::Failed;
    };

    CaptureResult result = backend.captureOnce(region, options_.captureTimeout);

    Region bounds = result.displayBounds;
    if (bounds.width() <= 0 || bounds.height() <= 0) {
        bounds = result.area;
    }

    // A region the display cannot satisfy is the caller's problem, not the
    // strategy's, so it ends the scan.
    std::optional<Region> target = bounds.width() > 0 && bounds.height() > 0
                                       ? std::optional<Region>(bounds)
                                       : std::nullopt;
    if (region && target) {
        target = intersectRegion(*region, *target);
        if (!target || target->width() < kMinRegionSize ||
            target->height() < kMinRegionSize) {
            failure = "region " + regionToString(*region) +
                      " does not fit the display " + regionToString(bounds);
            return AttemptStatus::InvalidRegion;
        }
    }

    if (!result.error.empty()) {
        return fail(result.error);
    }
    if (!isWellFormed(result.image)) {
        return fail("empty or malformed image payload");
    }
    if (result.area.width() != result.image.w ||
        result.area.height() != result.image.h) {
        return fail("image size does not match the reported area");
    }
    if (!target) {
        return fail("strategy reported no display bounds");
    }

    auto covered = intersectRegion(*target, result.area);
    if (!covered) {
        return fail("image does not cover the requested region");
    }
    if (region && (covered->width() < kMinRegionSize ||
                   covered->height() < kMinRegionSize)) {
        failure = "region " + regionToString(*region) +
                  " is too small after clamping";
        return AttemptStatus::InvalidRegion;
    }

    ImageRGBA cropped;
    const ImageRGBA* image = &result.image;
    if (*covered != result.area) {
        if (!cropImage(result.image, result.area, *covered, cropped)) {
            return fail("failed to crop image");
        }
        image = &cropped;
    }

    Frame frame;
    std::string encodeErr;
    if (!encodePng(*image, frame.bytes, &encodeErr)) {
        return fail(encodeErr);
    }
    frame.width = image->w;
    frame.height = image->h;
    frame.capturedAt = wallNow();
    frame.strategy = backend.name();
    frame.success = true;
    frame.region = *covered;
    frame.clamped = region.has_value() && *covered != *region;
    if (frame.clamped) {
        LOG_DEBUG("region %s clamped to %s", regionToString(*region).c_str(),
                  regionToString(*covered).c_str());
    }
    out = std::move(frame);
    return AttemptStatus::Ok;
}

std::vector<MonitorInfo> CaptureChain::listMonitors() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (preferred_ >= 0) {
        auto monitors =
            entries_[static_cast<size_t>(preferred_)].strategy.backend
                ->listMonitors();
        if (!monitors.empty()) {
            return monitors;
        }
    }
    for (auto& entry : entries_) {
        auto monitors = entry.strategy.backend->listMonitors();
        if (!monitors.empty()) {
            return monitors;
        }
    }
    return {};
}

std::vector<StrategyInfo> CaptureChain::chainInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StrategyInfo> out;
    out.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i) {
        const Entry& entry = entries_[i];
        StrategyInfo info;
        info.kind = entry.strategy.kind;
        info.name = entry.strategy.backend->name();
        info.position = static_cast<int>(i);
        info.preferred = static_cast<int>(i) == preferred_;
        info.attempts = entry.attempts;
        info.failures = entry.failures;
        info.lastError = entry.lastError;
        out.push_back(std::move(info));
    }
    return out;
}

int CaptureChain::preferredIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return preferred_;
}

void CaptureChain::resetPreferred() {
    std::lock_guard<std::mutex> lock(mutex_);
    preferred_ = -1;
    preferredFailures_ = 0;
}

size_t CaptureChain::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace roiwatch
