#include "monitor/RoiMonitor.hpp"

#include <cmath>
#include <cstddef>
#include <cstdio>
#include <numeric>
#include <random>
#include <utility>

#include "capture/Region.hpp"
#include "detect/DetectorFactory.hpp"
#include "platform/Log.hpp"

namespace roiwatch {

namespace {

void setError(MonitorError* err, MonitorErrorKind kind,
              const std::string& message) {
    if (err) {
        err->kind = kind;
        err->message = message;
    }
}

// 128 random bits as 32 hex digits.
std::string makeSessionId() {
    std::random_device rd;
    std::mt19937_64 rng((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    char buf[33];
    std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                  static_cast<unsigned long long>(rng()),
                  static_cast<unsigned long long>(rng()));
    return buf;
}

bool validateThreshold(DetectionKind kind, double threshold,
                       std::string* reason) {
    if (!std::isfinite(threshold) || threshold < 0.0) {
        *reason = "threshold must be a non-negative number";
        return false;
    }
    // Hash verdicts are binary; any non-negative threshold is accepted.
    if (kind != DetectionKind::Hash && threshold > 100.0) {
        *reason = "threshold must be within 0-100 for " +
                  detectionKindToString(kind);
        return false;
    }
    return true;
}

double average(const std::deque<double>& window) {
    if (window.empty()) {
        return 0.0;
    }
    return std::accumulate(window.begin(), window.end(), 0.0) /
           static_cast<double>(window.size());
}

}  // namespace

std::string monitorStateToString(MonitorState state) {
    switch (state) {
        case MonitorState::Idle:
            return "idle";
        case MonitorState::Running:
            return "running";
        case MonitorState::Paused:
            return "paused";
        case MonitorState::Stopped:
            return "stopped";
        case MonitorState::Failed:
            return "failed";
    }
    return "unknown";
}

std::string monitorErrorKindToString(MonitorErrorKind kind) {
    switch (kind) {
        case MonitorErrorKind::None:
            return "none";
        case MonitorErrorKind::InvalidRegion:
            return "invalid_region";
        case MonitorErrorKind::AlreadyRunning:
            return "already_running";
        case MonitorErrorKind::CaptureFailed:
            return "capture_failed";
        case MonitorErrorKind::InvalidState:
            return "invalid_state";
        case MonitorErrorKind::InvalidStrategy:
            return "invalid_strategy";
        case MonitorErrorKind::InvalidThreshold:
            return "invalid_threshold";
        case MonitorErrorKind::InvalidInterval:
            return "invalid_interval";
    }
    return "unknown";
}

RoiMonitor::RoiMonitor(CaptureChain& chain, EventBus& bus)
    : chain_(chain), bus_(bus) {}

RoiMonitor::~RoiMonitor() {
    stop(kStopReasonShutdown);
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker = std::move(worker_);
    }
    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            LOG_ERROR("monitor destroyed from its own worker thread");
            worker.detach();
        } else {
            worker.join();
        }
    }
}

bool RoiMonitor::start(const MonitorConfig& config, std::string* sessionId,
                       MonitorError* err) {
    std::string reason;
    if (!validateRegion(config.region, &reason)) {
        setError(err, MonitorErrorKind::InvalidRegion, reason);
        return false;
    }
    if (!validateThreshold(config.strategy, config.threshold, &reason)) {
        setError(err, MonitorErrorKind::InvalidThreshold, reason);
        return false;
    }
    if (config.intervalMs <= 0) {
        setError(err, MonitorErrorKind::InvalidInterval,
                 "interval must be positive");
        return false;
    }

    std::thread previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (starting_ || state_ == MonitorState::Running ||
            state_ == MonitorState::Paused) {
            setError(err, MonitorErrorKind::AlreadyRunning,
                     "session " + sessionId_ + " is " +
                         monitorStateToString(state_));
            return false;
        }
        if (worker_.joinable()) {
            if (worker_.get_id() == std::this_thread::get_id()) {
                setError(err, MonitorErrorKind::InvalidState,
                         "cannot start a session from the worker thread");
                return false;
            }
            previous = std::move(worker_);
        }
        starting_ = true;
    }
    if (previous.joinable()) {
        previous.join();
    }

    const double t0 = nowSeconds();
    Frame frame;
    CaptureError captureErr;
    const bool captured = chain_.capture(config.region, frame, &captureErr);
    const double cycleMs = (nowSeconds() - t0) * 1000.0;

    const std::string id = makeSessionId();
    std::vector<Event> events;
    std::uint64_t session = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        starting_ = false;
        if (!captured && captureErr.kind == CaptureErrorKind::InvalidRegion) {
            setError(err, MonitorErrorKind::InvalidRegion, captureErr.message);
            return false;
        }

        session = ++session_;
        sessionId_ = id;
        config_ = config;
        detection_ = std::make_unique<DetectionContext>(config.strategy,
                                                        config.threshold);
        startedAt_ = wallNow();
        lastTick_ = std::chrono::steady_clock::now();
        ticks_ = 0;
        changes_ = 0;
        consecutiveFailures_ = 0;
        totalErrors_ = 0;
        lastError_.clear();
        lastCaptureStrategy_.clear();
        cycleTimes_.clear();
        detectionTimes_.clear();
        history_.clear();

        if (!captured) {
            state_ = MonitorState::Failed;
            consecutiveFailures_ = 1;
            totalErrors_ = 1;
            lastError_ = captureErr.message;
            events.push_back(
                makeEvent(CaptureFailedEvent{id, captureErr, 1}));
        } else {
            lastCaptureStrategy_ = frame.strategy;
            recordPerf(cycleTimes_, cycleMs);
            detection_->resetBaseline(
                std::make_shared<const Frame>(std::move(frame)));
            state_ = MonitorState::Running;
            events.push_back(makeEvent(MonitoringStartedEvent{
                id, config.region, detection_->strategyName(),
                config.threshold, config.intervalMs}));
        }
    }

    if (!captured) {
        LOG_ERROR("session %s: initial capture failed: %s", id.c_str(),
                  captureErr.message.c_str());
        publishAll(events);
        setError(err, MonitorErrorKind::CaptureFailed,
                 "initial capture failed: " + captureErr.message);
        return false;
    }

    LOG_INFO("session %s started: region %s, strategy %s, threshold %.2f, "
             "interval %d ms",
             id.c_str(), regionToString(config.region).c_str(),
             detectionKindToString(config.strategy).c_str(), config.threshold,
             config.intervalMs);
    publishAll(events);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A handler may already have stopped the session.
        if (sessionActive(session)) {
            worker_ = std::thread(&RoiMonitor::run, this, session);
        }
    }
    if (sessionId) {
        *sessionId = id;
    }
    return true;
}

void RoiMonitor::stop(const std::string& reason) {
    std::thread worker;
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != MonitorState::Running &&
            state_ != MonitorState::Paused) {
            return;
        }
        state_ = MonitorState::Stopped;
        id = sessionId_;
        if (worker_.joinable() &&
            worker_.get_id() != std::this_thread::get_id()) {
            worker = std::move(worker_);
        }
    }
    cv_.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
    LOG_INFO("session %s stopped: %s", id.c_str(), reason.c_str());
    bus_.publish(makeEvent(MonitoringStoppedEvent{id, reason}));
}

bool RoiMonitor::pause(MonitorError* err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != MonitorState::Running) {
            setError(err, MonitorErrorKind::InvalidState,
                     "cannot pause while " + monitorStateToString(state_));
            return false;
        }
        state_ = MonitorState::Paused;
    }
    cv_.notify_all();
    LOG_DEBUG("monitor paused");
    return true;
}

bool RoiMonitor::resume(MonitorError* err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != MonitorState::Paused) {
            setError(err, MonitorErrorKind::InvalidState,
                     "cannot resume while " + monitorStateToString(state_));
            return false;
        }
        state_ = MonitorState::Running;
        lastTick_ = std::chrono::steady_clock::now();
    }
    cv_.notify_all();
    LOG_DEBUG("monitor resumed");
    return true;
}

bool RoiMonitor::changeStrategy(DetectionKind kind, bool resetBaseline,
                                MonitorError* err) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!requireSession("change strategy", err)) {
            return false;
        }
        std::string reason;
        if (!validateThreshold(kind, detection_->threshold(), &reason)) {
            setError(err, MonitorErrorKind::InvalidThreshold, reason);
            return false;
        }
        const std::string oldName = detection_->strategyName();
        detection_->setStrategy(kind, resetBaseline);
        config_.strategy = kind;
        LOG_INFO("strategy %s -> %s%s", oldName.c_str(),
                 detection_->strategyName().c_str(),
                 resetBaseline ? " (baseline reset)" : "");
        events.push_back(makeEvent(StrategyChangedEvent{
            sessionId_, oldName, detection_->strategyName(), resetBaseline}));
    }
    publishAll(events);
    return true;
}

bool RoiMonitor::changeStrategy(const std::string& name, bool resetBaseline,
                                MonitorError* err) {
    DetectionKind kind;
    if (!parseDetectionKind(name, kind)) {
        setError(err, MonitorErrorKind::InvalidStrategy,
                 "unknown strategy '" + name + "'");
        return false;
    }
    return changeStrategy(kind, resetBaseline, err);
}

bool RoiMonitor::forceCapture(FramePtr& out, MonitorError* err) {
    CycleInput input;
    bool compare = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == MonitorState::Stopped ||
            state_ == MonitorState::Failed) {
            setError(err, MonitorErrorKind::InvalidState,
                     "cannot capture while " + monitorStateToString(state_));
            return false;
        }
        if (state_ == MonitorState::Running ||
            state_ == MonitorState::Paused) {
            input = makeCycleInput();
            compare = true;
        }
    }

    if (!compare) {
        Frame frame;
        CaptureError captureErr;
        if (!chain_.capture(std::nullopt, frame, &captureErr)) {
            setError(err, MonitorErrorKind::CaptureFailed, captureErr.message);
            return false;
        }
        out = std::make_shared<const Frame>(std::move(frame));
        return true;
    }

    CycleResult result = runCycle(input);
    std::vector<Event> events;
    FramePtr frame;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        frame = commitCycle(input, result, true, events);
    }
    publishAll(events);
    if (!result.captured) {
        setError(err, MonitorErrorKind::CaptureFailed, result.error.message);
        return false;
    }
    out = frame;
    return true;
}

bool RoiMonitor::updateRegion(const Region& region, MonitorError* err) {
    std::string reason;
    if (!validateRegion(region, &reason)) {
        setError(err, MonitorErrorKind::InvalidRegion, reason);
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!requireSession("update region", err)) {
        return false;
    }
    config_.region = region;
    detection_->resetBaseline(nullptr);
    LOG_INFO("region updated to %s, baseline reset",
             regionToString(region).c_str());
    return true;
}

bool RoiMonitor::setThreshold(double threshold, MonitorError* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!requireSession("set threshold", err)) {
        return false;
    }
    std::string reason;
    if (!validateThreshold(detection_->kind(), threshold, &reason)) {
        setError(err, MonitorErrorKind::InvalidThreshold, reason);
        return false;
    }
    config_.threshold = threshold;
    detection_->setThreshold(threshold);
    LOG_DEBUG("threshold set to %.2f", threshold);
    return true;
}

bool RoiMonitor::setInterval(int intervalMs, MonitorError* err) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!requireSession("set interval", err)) {
            return false;
        }
        if (intervalMs <= 0) {
            setError(err, MonitorErrorKind::InvalidInterval,
                     "interval must be positive");
            return false;
        }
        config_.intervalMs = intervalMs;
    }
    cv_.notify_all();
    LOG_DEBUG("interval set to %d ms", intervalMs);
    return true;
}

bool RoiMonitor::resetBaseline(MonitorError* err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!requireSession("reset baseline", err)) {
        return false;
    }
    detection_->resetBaseline(nullptr);
    LOG_DEBUG("baseline reset");
    return true;
}

MonitorState RoiMonitor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

MonitorStatus RoiMonitor::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MonitorStatus st;
    st.state = state_;
    st.sessionId = sessionId_;
    st.region = config_.region;
    st.strategy = detection_ ? detection_->strategyName()
                             : detectionKindToString(config_.strategy);
    st.threshold = config_.threshold;
    st.intervalMs = config_.intervalMs;
    st.startedAt = startedAt_;
    st.ticks = ticks_;
    st.changesDetected = changes_;
    st.consecutiveFailures = consecutiveFailures_;
    st.totalCaptureErrors = totalErrors_;
    st.lastError = lastError_;
    st.lastCaptureStrategy = lastCaptureStrategy_;
    st.hasBaseline = detection_ && detection_->hasBaseline();
    st.avgCycleMs = average(cycleTimes_);
    st.avgDetectionMs = average(detectionTimes_);
    return st;
}

FramePtr RoiMonitor::baseline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return detection_ ? detection_->baseline() : nullptr;
}

std::vector<ChangeRecord> RoiMonitor::changeHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t skip = 0;
    if (limit > 0 && history_.size() > limit) {
        skip = history_.size() - limit;
    }
    auto first = history_.begin() + static_cast<std::ptrdiff_t>(skip);
    return std::vector<ChangeRecord>(first, history_.end());
}

void RoiMonitor::run(std::uint64_t session) {
    using clock = std::chrono::steady_clock;
    LOG_DEBUG("worker started");
    std::unique_lock<std::mutex> lock(mutex_);
    while (sessionActive(session)) {
        if (state_ == MonitorState::Paused) {
            cv_.wait(lock, [&] {
                return !sessionActive(session) ||
                       state_ != MonitorState::Paused;
            });
            continue;
        }
        auto due = lastTick_ + std::chrono::milliseconds(config_.intervalMs);
        if (clock::now() < due) {
            // Woken early by stop, pause or an interval change; re-evaluate.
            cv_.wait_until(lock, due);
            continue;
        }

        lastTick_ = clock::now();
        CycleInput input = makeCycleInput();
        lock.unlock();

        CycleResult result = runCycle(input);
        std::vector<Event> events;

        lock.lock();
        commitCycle(input, result, false, events);
        lock.unlock();
        publishAll(events);
        lock.lock();
    }
    LOG_DEBUG("worker exiting");
}

RoiMonitor::CycleResult RoiMonitor::runCycle(const CycleInput& input) {
    CycleResult result;
    const double t0 = nowSeconds();
    result.captured = chain_.capture(input.region, result.frame, &result.error);
    if (result.captured) {
        result.compared = DetectionContext::evaluate(
            input.detection, result.frame, result.verdict);
    }
    result.cycleMs = (nowSeconds() - t0) * 1000.0;
    return result;
}

FramePtr RoiMonitor::commitCycle(const CycleInput& input, CycleResult& result,
                                 bool forced, std::vector<Event>& events) {
    if (input.session != session_ || !detection_) {
        return result.captured
                   ? std::make_shared<const Frame>(std::move(result.frame))
                   : nullptr;
    }
    const bool active = sessionActive(input.session);
    if (!forced && active) {
        ++ticks_;
    }

    if (!result.captured) {
        ++totalErrors_;
        lastError_ = result.error.message;
        // Manual captures are reported but do not count toward the cap.
        if (!forced && active) {
            ++consecutiveFailures_;
        }
        LOG_WARN("capture failed (%d consecutive): %s", consecutiveFailures_,
                 result.error.message.c_str());
        events.push_back(makeEvent(CaptureFailedEvent{
            sessionId_, result.error, consecutiveFailures_}));
        if (!forced && active &&
            consecutiveFailures_ >= kMaxConsecutiveFailures) {
            state_ = MonitorState::Failed;
            LOG_ERROR("session %s failed after %d consecutive capture "
                      "failures",
                      sessionId_.c_str(), consecutiveFailures_);
            events.push_back(makeEvent(
                MonitoringStoppedEvent{sessionId_, kStopReasonFailures}));
        }
        return nullptr;
    }

    FramePtr frame = std::make_shared<const Frame>(std::move(result.frame));
    if (!active) {
        return frame;
    }
    consecutiveFailures_ = 0;
    lastCaptureStrategy_ = frame->strategy;
    recordPerf(cycleTimes_, result.cycleMs);

    if (!detection_->hasBaseline()) {
        detection_->resetBaseline(frame);
        LOG_DEBUG("baseline seeded (%dx%d, %zu bytes)", frame->width,
                  frame->height, frame->bytes.size());
        return frame;
    }
    if (!result.compared ||
        input.detection.generation != detection_->generation()) {
        LOG_DEBUG("discarding comparison made against a stale baseline");
        return frame;
    }

    recordPerf(detectionTimes_, result.verdict.elapsedMs);
    if (!result.verdict.changed) {
        return frame;
    }

    detection_->resetBaseline(frame);
    ++changes_;
    ChangeRecord record;
    record.changeNumber = changes_;
    record.verdict = result.verdict;
    record.width = frame->width;
    record.height = frame->height;
    record.bytes = frame->bytes.size();
    record.captureStrategy = frame->strategy;
    history_.push_back(std::move(record));
    if (history_.size() > kMaxChangeHistory) {
        history_.pop_front();
    }
    LOG_INFO("change #%llu detected by %s (magnitude %.2f)",
             static_cast<unsigned long long>(changes_),
             result.verdict.strategy.c_str(), result.verdict.magnitude);
    events.push_back(makeEvent(
        ChangeDetectedEvent{sessionId_, result.verdict, frame, changes_}));
    return frame;
}

bool RoiMonitor::sessionActive(std::uint64_t session) const {
    return session == session_ && (state_ == MonitorState::Running ||
                                   state_ == MonitorState::Paused);
}

bool RoiMonitor::requireSession(const char* op, MonitorError* err) const {
    if ((state_ == MonitorState::Running || state_ == MonitorState::Paused) &&
        detection_) {
        return true;
    }
    setError(err, MonitorErrorKind::InvalidState,
             std::string("cannot ") + op + " while " +
                 monitorStateToString(state_));
    return false;
}

RoiMonitor::CycleInput RoiMonitor::makeCycleInput() const {
    CycleInput input;
    input.session = session_;
    input.region = config_.region;
    input.detection = detection_->snapshot();
    return input;
}

void RoiMonitor::publishAll(std::vector<Event>& events) {
    for (const auto& event : events) {
        bus_.publish(event);
    }
    events.clear();
}

void RoiMonitor::recordPerf(std::deque<double>& window, double value) {
    window.push_back(value);
    if (window.size() > kPerfWindow) {
        window.pop_front();
    }
}

}  // namespace roiwatch
