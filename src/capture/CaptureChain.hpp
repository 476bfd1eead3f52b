#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "capture/BackendFactory.hpp"
#include "capture/CaptureTypes.hpp"
#include "capture/ICaptureBackend.hpp"
#include "platform/Capabilities.hpp"

namespace roiwatch {

enum class CaptureErrorKind { StrategyFailed, InvalidRegion, NoStrategies };

struct StrategyFailure {
    std::string strategy;
    std::string message;
};

struct CaptureError {
    CaptureErrorKind kind = CaptureErrorKind::StrategyFailed;
    std::string message;
    std::vector<StrategyFailure> failures;
};

// One entry of the fallback list. `kind` tags where the backend came from;
// tests use BackendKind::Auto for their fakes.
struct CaptureStrategy {
    BackendKind kind = BackendKind::Auto;
    std::unique_ptr<ICaptureBackend> backend;
};

struct CaptureChainOptions {
    std::chrono::milliseconds captureTimeout{5000};
};

struct StrategyInfo {
    BackendKind kind = BackendKind::Auto;
    std::string name;
    int position = 0;
    bool preferred = false;
    std::uint64_t attempts = 0;
    std::uint64_t failures = 0;
    std::string lastError;
};

// Ordered list of capture strategies with a memo of the last one that
// worked. Safe to call from several threads; captures are serialized.
class CaptureChain {
public:
    // Builds the recommended order for `caps`.
    explicit CaptureChain(const PlatformCapabilities& caps,
                          CaptureChainOptions options = {});
    // A chain of exactly one strategy (`--backend x11` and friends).
    CaptureChain(const PlatformCapabilities& caps, BackendKind pinned,
                 CaptureChainOptions options = {});
    explicit CaptureChain(std::vector<CaptureStrategy> strategies,
                          CaptureChainOptions options = {});

    CaptureChain(const CaptureChain&) = delete;
    CaptureChain& operator=(const CaptureChain&) = delete;

    // Full virtual display when `region` is empty, otherwise the region
    // clamped to the display.
    bool capture(const std::optional<Region>& region, Frame& out,
                 CaptureError* err);

    std::vector<MonitorInfo> listMonitors();
    std::vector<StrategyInfo> chainInfo() const;
    int preferredIndex() const;
    // Forget the memo; the next capture scans the whole list again.
    void resetPreferred();
    size_t size() const;

private:
    struct Entry {
        CaptureStrategy strategy;
        std::uint64_t attempts = 0;
        std::uint64_t failures = 0;
        std::string lastError;
    };

    enum class AttemptStatus { Ok, Failed, InvalidRegion };

    AttemptStatus attempt(size_t index, const std::optional<Region>& region,
                          Frame& out, std::string& failure);

    CaptureChainOptions options_;
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    int preferred_ = -1;
    int preferredFailures_ = 0;
};

}  // namespace roiwatch
