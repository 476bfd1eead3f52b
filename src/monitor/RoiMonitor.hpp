#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "capture/CaptureChain.hpp"
#include "capture/CaptureTypes.hpp"
#include "detect/DetectionContext.hpp"
#include "monitor/EventBus.hpp"
#include "platform/Time.hpp"

namespace roiwatch {

constexpr int kMaxConsecutiveFailures = 5;
constexpr size_t kMaxChangeHistory = 100;
constexpr size_t kPerfWindow = 50;

inline constexpr const char* kStopReasonFailures = "capture_failures_exceeded";
inline constexpr const char* kStopReasonShutdown = "shutdown";

enum class MonitorState { Idle, Running, Paused, Stopped, Failed };

enum class MonitorErrorKind {
    None,
    InvalidRegion,
    AlreadyRunning,
    CaptureFailed,
    InvalidState,
    InvalidStrategy,
    InvalidThreshold,
    InvalidInterval,
};

struct MonitorError {
    MonitorErrorKind kind = MonitorErrorKind::None;
    std::string message;
};

struct MonitorConfig {
    Region region;
    DetectionKind strategy = DetectionKind::Size;
    double threshold = 20.0;
    int intervalMs = 500;
};

struct MonitorStatus {
    MonitorState state = MonitorState::Idle;
    std::string sessionId;
    Region region;
    std::string strategy;
    double threshold = 0.0;
    int intervalMs = 0;
    std::optional<Timestamp> startedAt;
    std::uint64_t ticks = 0;
    std::uint64_t changesDetected = 0;
    int consecutiveFailures = 0;
    std::uint64_t totalCaptureErrors = 0;
    std::string lastError;
    std::string lastCaptureStrategy;
    bool hasBaseline = false;
    double avgCycleMs = 0.0;
    double avgDetectionMs = 0.0;
};

struct ChangeRecord {
    std::uint64_t changeNumber = 0;
    Verdict verdict;
    int width = 0;
    int height = 0;
    size_t bytes = 0;
    std::string captureStrategy;
};

std::string monitorStateToString(MonitorState state);
std::string monitorErrorKindToString(MonitorErrorKind kind);

// Watches one screen region on a background thread. Each tick captures the
// region through the chain, compares it with the baseline and publishes a
// ChangeDetected event when the active strategy says it changed.
//
// All methods are safe to call from any thread, including from inside an
// event handler. Events are always published with no lock held.
class RoiMonitor {
public:
    RoiMonitor(CaptureChain& chain, EventBus& bus);
    ~RoiMonitor();

    RoiMonitor(const RoiMonitor&) = delete;
    RoiMonitor& operator=(const RoiMonitor&) = delete;

    // Validates the config, captures the initial baseline and starts the
    // worker. A failed initial capture leaves the monitor in Failed.
    bool start(const MonitorConfig& config, std::string* sessionId,
               MonitorError* err);
    // No-op unless Running or Paused. Blocks until the worker has exited,
    // except when called from the worker itself.
    void stop(const std::string& reason);

    bool pause(MonitorError* err);
    bool resume(MonitorError* err);

    bool changeStrategy(DetectionKind kind, bool resetBaseline,
                        MonitorError* err);
    bool changeStrategy(const std::string& name, bool resetBaseline,
                        MonitorError* err);

    // Idle: full-display capture, nothing compared. Running or Paused: one
    // out-of-band capture and compare against the session region.
    bool forceCapture(FramePtr& out, MonitorError* err);

    bool updateRegion(const Region& region, MonitorError* err);
    bool setThreshold(double threshold, MonitorError* err);
    bool setInterval(int intervalMs, MonitorError* err);
    // The next capture seeds a new baseline.
    bool resetBaseline(MonitorError* err);

    MonitorState state() const;
    MonitorStatus status() const;
    FramePtr baseline() const;
    // Newest last; `limit` 0 returns everything kept.
    std::vector<ChangeRecord> changeHistory(size_t limit = 0) const;

private:
    // Everything a capture cycle needs, copied under the lock.
    struct CycleInput {
        std::uint64_t session = 0;
        Region region;
        DetectionContext::Snapshot detection;
    };

    struct CycleResult {
        bool captured = false;
        Frame frame;
        CaptureError error;
        bool compared = false;
        Verdict verdict;
        double cycleMs = 0.0;
    };

    void run(std::uint64_t session);
    CycleResult runCycle(const CycleInput& input);
    // Applies a finished cycle to the session. Returns the shared frame and
    // appends the events to publish once the lock is released.
    FramePtr commitCycle(const CycleInput& input, CycleResult& result,
                         bool forced, std::vector<Event>& events);

    bool sessionActive(std::uint64_t session) const;
    bool requireSession(const char* op, MonitorError* err) const;
    CycleInput makeCycleInput() const;
    void publishAll(std::vector<Event>& events);
    void recordPerf(std::deque<double>& window, double value);

    CaptureChain& chain_;
    EventBus& bus_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;

    MonitorState state_ = MonitorState::Idle;
    bool starting_ = false;
    std::uint64_t session_ = 0;
    std::string sessionId_;
    MonitorConfig config_;
    std::unique_ptr<DetectionContext> detection_;
    std::chrono::steady_clock::time_point lastTick_{};

    std::optional<Timestamp> startedAt_;
    std::uint64_t ticks_ = 0;
    std::uint64_t changes_ = 0;
    int consecutiveFailures_ = 0;
    std::uint64_t totalErrors_ = 0;
    std::string lastError_;
    std::string lastCaptureStrategy_;
    std::deque<double> cycleTimes_;
    std::deque<double> detectionTimes_;
    std::deque<ChangeRecord> history_;
};

}  // namespace roiwatch
