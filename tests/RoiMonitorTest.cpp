#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "FakeBackend.hpp"
#include "monitor/EventBus.hpp"
#include "monitor/RoiMonitor.hpp"

namespace roiwatch {
namespace {

using std::chrono::milliseconds;

class EventRecorder {
public:
    explicit EventRecorder(EventBus& bus) {
        bus.subscribeAll([this](const Event& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(e);
        });
    }

    int count(EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(
            std::count_if(events_.begin(), events_.end(),
                          [type](const Event& e) { return e.type() == type; }));
    }

    std::vector<Event> ofType(EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> out;
        for (const auto& e : events_) {
            if (e.type() == type) {
                out.push_back(e);
            }
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

class RoiMonitorTest : public ::testing::Test {
protected:
    RoiMonitorTest() {
        std::vector<CaptureStrategy> strategies;
        fake_ = addFake(strategies, "fake");
        chain_ = std::make_unique<CaptureChain>(std::move(strategies));
        monitor_ = std::make_unique<RoiMonitor>(*chain_, bus_);
    }

    ~RoiMonitorTest() override {
        monitor_.reset();
    }

    static MonitorConfig config(DetectionKind kind = DetectionKind::Hash,
                                int intervalMs = 10) {
        MonitorConfig cfg;
        cfg.region = Region{0, 0, 100, 100};
        cfg.strategy = kind;
        cfg.threshold = 0.0;
        cfg.intervalMs = intervalMs;
        return cfg;
    }

    void startOrFail(const MonitorConfig& cfg) {
        MonitorError err;
        ASSERT_TRUE(monitor_->start(cfg, nullptr, &err)) << err.message;
    }

    EventBus bus_;
    EventRecorder events_{bus_};
    FakeBackend* fake_ = nullptr;
    std::unique_ptr<CaptureChain> chain_;
    std::unique_ptr<RoiMonitor> monitor_;
};

constexpr int kSlowInterval = 60000;

TEST_F(RoiMonitorTest, StartRejectsInvalidRegion) {
    MonitorConfig cfg = config();
    cfg.region = Region{0, 0, 5, 100};
    MonitorError err;
    EXPECT_FALSE(monitor_->start(cfg, nullptr, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidRegion);
    EXPECT_EQ(monitor_->state(), MonitorState::Idle);
    EXPECT_EQ(fake_->attempts(), 0);
    EXPECT_EQ(events_.size(), 0u);
}

TEST_F(RoiMonitorTest, StartRejectsRegionOffDisplay) {
    MonitorConfig cfg = config();
    cfg.region = Region{500, 500, 600, 600};
    MonitorError err;
    EXPECT_FALSE(monitor_->start(cfg, nullptr, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidRegion);
    EXPECT_EQ(monitor_->state(), MonitorState::Idle);
}

TEST_F(RoiMonitorTest, StartRejectsBadThresholdAndInterval) {
    MonitorConfig cfg = config(DetectionKind::Pixel);
    cfg.threshold = 101.0;
    MonitorError err;
    EXPECT_FALSE(monitor_->start(cfg, nullptr, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidThreshold);

    cfg.threshold = -1.0;
    EXPECT_FALSE(monitor_->start(cfg, nullptr, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidThreshold);

    cfg = config();
    cfg.intervalMs = 0;
    EXPECT_FALSE(monitor_->start(cfg, nullptr, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidInterval);
    EXPECT_EQ(monitor_->state(), MonitorState::Idle);
}

TEST_F(RoiMonitorTest, StartSeedsBaselineAndRuns) {
    std::string sessionId;
    MonitorError err;
    ASSERT_TRUE(
        monitor_->start(config(DetectionKind::Hash, kSlowInterval), &sessionId,
                        &err))
        << err.message;

    EXPECT_EQ(sessionId.size(), 32u);
    EXPECT_TRUE(std::all_of(sessionId.begin(), sessionId.end(),
                            [](char c) { return std::isxdigit(c) != 0; }));
    EXPECT_EQ(monitor_->state(), MonitorState::Running);

    FramePtr baseline = monitor_->baseline();
    ASSERT_NE(baseline, nullptr);
    EXPECT_EQ(baseline->width, 100);
    EXPECT_EQ(baseline->height, 100);

    MonitorStatus st = monitor_->status();
    EXPECT_EQ(st.sessionId, sessionId);
    EXPECT_EQ(st.strategy, "hash");
    EXPECT_EQ(st.region, (Region{0, 0, 100, 100}));
    EXPECT_TRUE(st.startedAt.has_value());
    EXPECT_TRUE(st.hasBaseline);
    EXPECT_EQ(st.ticks, 0u);
    EXPECT_EQ(st.lastCaptureStrategy, "fake");
    ASSERT_EQ(events_.count(EventType::MonitoringStarted), 1);
    auto started = std::get<MonitoringStartedEvent>(
        events_.ofType(EventType::MonitoringStarted)[0].payload);
    EXPECT_EQ(started.sessionId, sessionId);
}

TEST_F(RoiMonitorTest, StartWhileRunningIsRejected) {
    std::string first;
    ASSERT_TRUE(monitor_->start(config(), &first, nullptr));

    MonitorError err;
    std::string second;
    EXPECT_FALSE(monitor_->start(config(DetectionKind::Size), &second, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::AlreadyRunning);
    EXPECT_TRUE(second.empty());

    MonitorStatus st = monitor_->status();
    EXPECT_EQ(st.state, MonitorState::Running);
    EXPECT_EQ(st.sessionId, first);
    EXPECT_EQ(st.strategy, "hash");
    EXPECT_EQ(events_.count(EventType::MonitoringStarted), 1);
}

TEST_F(RoiMonitorTest, StopIsIdempotent) {
    monitor_->stop("nothing to stop");
    EXPECT_EQ(monitor_->state(), MonitorState::Idle);
    EXPECT_EQ(events_.count(EventType::MonitoringStopped), 0);

    startOrFail(config());
    monitor_->stop("user");
    EXPECT_EQ(monitor_->state(), MonitorState::Stopped);
    monitor_->stop("again");
    EXPECT_EQ(monitor_->state(), MonitorState::Stopped);

    auto stops = events_.ofType(EventType::MonitoringStopped);
    ASSERT_EQ(stops.size(), 1u);
    EXPECT_EQ(std::get<MonitoringStoppedEvent>(stops[0].payload).reason,
              "user");
}

TEST_F(RoiMonitorTest, RestartAfterStopBeginsNewSession) {
    std::string first;
    ASSERT_TRUE(monitor_->start(config(), &first, nullptr));
    ASSERT_TRUE(waitFor([&] { return monitor_->status().ticks >= 2; }));
    monitor_->stop("user");

    std::string second;
    ASSERT_TRUE(monitor_->start(config(DetectionKind::Hash, kSlowInterval),
                                &second, nullptr));
    EXPECT_NE(first, second);
    MonitorStatus st = monitor_->status();
    EXPECT_EQ(st.state, MonitorState::Running);
    EXPECT_EQ(st.ticks, 0u);
    EXPECT_EQ(st.changesDetected, 0u);
}

TEST_F(RoiMonitorTest, FailedInitialCaptureFailsSession) {
    fake_->setFailing(true);
    MonitorError err;
    EXPECT_FALSE(monitor_->start(config(), nullptr, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::CaptureFailed);
    EXPECT_EQ(monitor_->state(), MonitorState::Failed);
    EXPECT_EQ(events_.count(EventType::CaptureFailed), 1);
    EXPECT_EQ(events_.count(EventType::MonitoringStarted), 0);
    EXPECT_FALSE(monitor_->status().hasBaseline);

    // Failed is terminal for the session, but a new Start replaces it.
    fake_->setFailing(false);
    startOrFail(config());
    EXPECT_EQ(monitor_->state(), MonitorState::Running);
}

TEST_F(RoiMonitorTest, ConsecutiveFailuresFailTheSession) {
    startOrFail(config());
    fake_->setFailing(true);

    ASSERT_TRUE(waitFor([&] {
        return events_.count(EventType::MonitoringStopped) == 1;
    }));
    EXPECT_EQ(monitor_->state(), MonitorState::Failed);

    const int attempts = fake_->attempts();
    std::this_thread::sleep_for(milliseconds(80));
    EXPECT_EQ(fake_->attempts(), attempts);

    EXPECT_EQ(events_.count(EventType::CaptureFailed),
              kMaxConsecutiveFailures);
    auto stops = events_.ofType(EventType::MonitoringStopped);
    ASSERT_EQ(stops.size(), 1u);
    EXPECT_EQ(std::get<MonitoringStoppedEvent>(stops[0].payload).reason,
              kStopReasonFailures);

    MonitorStatus st = monitor_->status();
    EXPECT_EQ(st.consecutiveFailures, kMaxConsecutiveFailures);
    EXPECT_EQ(st.totalCaptureErrors,
              static_cast<std::uint64_t>(kMaxConsecutiveFailures));
    EXPECT_EQ(st.lastError,
              "all capture strategies failed: fake: fake failure");

    monitor_->stop("late");
    EXPECT_EQ(events_.count(EventType::MonitoringStopped), 1);
}

TEST_F(RoiMonitorTest, SuccessResetsFailureCounter) {
    startOrFail(config());
    fake_->failNext(3);
    ASSERT_TRUE(waitFor([&] {
        MonitorStatus st = monitor_->status();
        return st.totalCaptureErrors == 3 && st.consecutiveFailures == 0;
    }));
    EXPECT_EQ(monitor_->state(), MonitorState::Running);
    EXPECT_EQ(events_.count(EventType::CaptureFailed), 3);
    EXPECT_EQ(events_.count(EventType::ChangeDetected), 0);
}

TEST_F(RoiMonitorTest, PauseStopsTickingUntilResume) {
    startOrFail(config());
    ASSERT_TRUE(waitFor([&] { return monitor_->status().ticks >= 2; }));

    MonitorError err;
    ASSERT_TRUE(monitor_->pause(&err)) << err.message;
    EXPECT_EQ(monitor_->state(), MonitorState::Paused);
    EXPECT_FALSE(monitor_->pause(&err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidState);

    std::this_thread::sleep_for(milliseconds(50));
    const auto ticks = monitor_->status().ticks;
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(monitor_->status().ticks, ticks);
    EXPECT_TRUE(monitor_->status().hasBaseline);

    ASSERT_TRUE(monitor_->resume(&err)) << err.message;
    EXPECT_FALSE(monitor_->resume(&err));
    ASSERT_TRUE(waitFor([&] { return monitor_->status().ticks > ticks; }));
}

TEST_F(RoiMonitorTest, PauseAndResumeNeedASession) {
    MonitorError err;
    EXPECT_FALSE(monitor_->pause(&err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidState);
    EXPECT_FALSE(monitor_->resume(&err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidState);
}

TEST_F(RoiMonitorTest, ChangeStrategyKeepsBaselineByDefault) {
    startOrFail(config(DetectionKind::Hash, kSlowInterval));
    FramePtr before = monitor_->baseline();

    MonitorError err;
    ASSERT_TRUE(monitor_->changeStrategy(DetectionKind::Pixel, false, &err))
        << err.message;
    EXPECT_EQ(monitor_->baseline(), before);
    EXPECT_EQ(monitor_->status().strategy, "pixel");

    auto changes = events_.ofType(EventType::StrategyChanged);
    ASSERT_EQ(changes.size(), 1u);
    const auto& e = std::get<StrategyChangedEvent>(changes[0].payload);
    EXPECT_EQ(e.oldStrategy, "hash");
    EXPECT_EQ(e.newStrategy, "pixel");
    EXPECT_FALSE(e.baselineReset);
}

TEST_F(RoiMonitorTest, ChangeStrategyWithResetReseedsBaseline) {
    startOrFail(config(DetectionKind::Hash, kSlowInterval));
    fake_->setColor(kWhite);

    MonitorError err;
    ASSERT_TRUE(monitor_->changeStrategy("pixel", true, &err)) << err.message;
    EXPECT_FALSE(monitor_->status().hasBaseline);

    // The next capture becomes the baseline instead of being compared.
    FramePtr frame;
    ASSERT_TRUE(monitor_->forceCapture(frame, &err)) << err.message;
    EXPECT_EQ(monitor_->baseline(), frame);
    EXPECT_EQ(events_.count(EventType::ChangeDetected), 0);
    EXPECT_EQ(monitor_->status().changesDetected, 0u);
}

TEST_F(RoiMonitorTest, ChangeStrategyValidation) {
    MonitorError err;
    EXPECT_FALSE(monitor_->changeStrategy(DetectionKind::Pixel, false, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidState);

    startOrFail(config(DetectionKind::Hash, kSlowInterval));
    EXPECT_FALSE(monitor_->changeStrategy("ssim", false, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidStrategy);
    EXPECT_EQ(monitor_->status().strategy, "hash");
    EXPECT_EQ(events_.count(EventType::StrategyChanged), 0);
}

TEST_F(RoiMonitorTest, ForceCaptureWhileIdleReturnsFullDisplay) {
    FramePtr frame;
    MonitorError err;
    ASSERT_TRUE(monitor_->forceCapture(frame, &err)) << err.message;
    ASSERT_NE(frame, nullptr);
    EXPECT_EQ(frame->width, kFakeDisplay.width());
    EXPECT_EQ(frame->height, kFakeDisplay.height());
    EXPECT_EQ(monitor_->state(), MonitorState::Idle);
    EXPECT_EQ(events_.size(), 0u);
}

TEST_F(RoiMonitorTest, ForceCaptureWhileRunningDetectsChange) {
    startOrFail(config(DetectionKind::Hash, kSlowInterval));
    fake_->setColor(kWhite);

    FramePtr frame;
    MonitorError err;
    ASSERT_TRUE(monitor_->forceCapture(frame, &err)) << err.message;
    EXPECT_EQ(frame->width, 100);
    EXPECT_EQ(monitor_->baseline(), frame);

    auto detected = events_.ofType(EventType::ChangeDetected);
    ASSERT_EQ(detected.size(), 1u);
    const auto& e = std::get<ChangeDetectedEvent>(detected[0].payload);
    EXPECT_EQ(e.frame, frame);
    EXPECT_TRUE(e.verdict.changed);
    EXPECT_EQ(e.changeNumber, 1u);

    MonitorStatus st = monitor_->status();
    EXPECT_EQ(st.changesDetected, 1u);
    EXPECT_EQ(st.ticks, 0u);

    auto history = monitor_->changeHistory();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].changeNumber, 1u);
    EXPECT_EQ(history[0].width, 100);
    EXPECT_EQ(history[0].captureStrategy, "fake");
}

TEST_F(RoiMonitorTest, ForceCaptureWhilePausedStillCompares) {
    startOrFail(config(DetectionKind::Hash, kSlowInterval));
    ASSERT_TRUE(monitor_->pause(nullptr));
    fake_->setColor(kWhite);

    FramePtr frame;
    ASSERT_TRUE(monitor_->forceCapture(frame, nullptr));
    EXPECT_EQ(events_.count(EventType::ChangeDetected), 1);
    EXPECT_EQ(monitor_->state(), MonitorState::Paused);
}

TEST_F(RoiMonitorTest, ForceCaptureFailureDoesNotCountTowardCap) {
    startOrFail(config(DetectionKind::Hash, kSlowInterval));
    fake_->failNext(1);

    FramePtr frame;
    MonitorError err;
    EXPECT_FALSE(monitor_->forceCapture(frame, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::CaptureFailed);
    EXPECT_EQ(events_.count(EventType::CaptureFailed), 1);
    MonitorStatus st = monitor_->status();
    EXPECT_EQ(st.consecutiveFailures, 0);
    EXPECT_EQ(st.totalCaptureErrors, 1u);
    EXPECT_EQ(st.state, MonitorState::Running);
}

TEST_F(RoiMonitorTest, ForceCaptureAfterStopIsInvalid) {
    startOrFail(config());
    monitor_->stop("user");
    FramePtr frame;
    MonitorError err;
    EXPECT_FALSE(monitor_->forceCapture(frame, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidState);
}

TEST_F(RoiMonitorTest, UpdateRegionResetsBaseline) {
    startOrFail(config(DetectionKind::Hash, kSlowInterval));

    MonitorError err;
    EXPECT_FALSE(monitor_->updateRegion(Region{0, 0, 100, 4}, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidRegion);
    EXPECT_TRUE(monitor_->status().hasBaseline);

    ASSERT_TRUE(monitor_->updateRegion(Region{10, 10, 60, 60}, &err))
        << err.message;
    MonitorStatus st = monitor_->status();
    EXPECT_EQ(st.region, (Region{10, 10, 60, 60}));
    EXPECT_FALSE(st.hasBaseline);

    FramePtr frame;
    ASSERT_TRUE(monitor_->forceCapture(frame, &err)) << err.message;
    EXPECT_EQ(frame->width, 50);
    EXPECT_EQ(monitor_->baseline(), frame);
    EXPECT_EQ(events_.count(EventType::ChangeDetected), 0);
}

TEST_F(RoiMonitorTest, ThresholdAndIntervalUpdates) {
    MonitorError err;
    EXPECT_FALSE(monitor_->setThreshold(10.0, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidState);

    startOrFail(config(DetectionKind::Pixel, kSlowInterval));
    EXPECT_FALSE(monitor_->setThreshold(150.0, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidThreshold);
    ASSERT_TRUE(monitor_->setThreshold(5.0, &err)) << err.message;

    EXPECT_FALSE(monitor_->setInterval(0, &err));
    EXPECT_EQ(err.kind, MonitorErrorKind::InvalidInterval);
    ASSERT_TRUE(monitor_->setInterval(10, &err)) << err.message;

    MonitorStatus st = monitor_->status();
    EXPECT_DOUBLE_EQ(st.threshold, 5.0);
    EXPECT_EQ(st.intervalMs, 10);
    // The shorter interval applies without waiting out the old one.
    ASSERT_TRUE(waitFor([&] { return monitor_->status().ticks >= 1; }));
}

TEST_F(RoiMonitorTest, ResetBaselineSeedsOnNextTick) {
    startOrFail(config(DetectionKind::Hash, kSlowInterval));
    MonitorError err;
    ASSERT_TRUE(monitor_->resetBaseline(&err)) << err.message;
    EXPECT_FALSE(monitor_->status().hasBaseline);
    fake_->setColor(kWhite);
    ASSERT_TRUE(monitor_->setInterval(10, &err)) << err.message;
    ASSERT_TRUE(waitFor([&] { return monitor_->status().hasBaseline; }));
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_EQ(events_.count(EventType::ChangeDetected), 0);
}

TEST_F(RoiMonitorTest, HandlerMayStopTheMonitor) {
    RoiMonitor* monitor = monitor_.get();
    bus_.subscribe(EventType::ChangeDetected,
                   [monitor](const Event&) { monitor->stop("handled"); });
    startOrFail(config());
    fake_->setColor(kWhite);

    ASSERT_TRUE(waitFor([&] {
        return events_.count(EventType::MonitoringStopped) == 1;
    }));
    EXPECT_EQ(monitor_->state(), MonitorState::Stopped);
    auto stops = events_.ofType(EventType::MonitoringStopped);
    EXPECT_EQ(std::get<MonitoringStoppedEvent>(stops[0].payload).reason,
              "handled");

    // The old worker is joined before the next session starts.
    startOrFail(config(DetectionKind::Hash, kSlowInterval));
    EXPECT_EQ(monitor_->state(), MonitorState::Running);
}

TEST_F(RoiMonitorTest, EndToEndHashScenario) {
    MonitorConfig cfg;
    cfg.region = Region{0, 0, 100, 100};
    cfg.strategy = DetectionKind::Hash;
    cfg.threshold = 0.0;
    cfg.intervalMs = 100;
    startOrFail(cfg);

    ASSERT_TRUE(waitFor([&] { return monitor_->status().ticks >= 2; }));
    EXPECT_EQ(events_.count(EventType::ChangeDetected), 0);

    fake_->setColor(kWhite);
    ASSERT_TRUE(
        waitFor([&] { return monitor_->status().changesDetected == 1; }));
    const auto ticks = monitor_->status().ticks;
    ASSERT_TRUE(waitFor([&] { return monitor_->status().ticks >= ticks + 2; }));

    EXPECT_EQ(events_.count(EventType::ChangeDetected), 1);
    EXPECT_EQ(monitor_->status().changesDetected, 1u);
    EXPECT_GT(monitor_->status().avgCycleMs, 0.0);
}

}  // namespace
}  // namespace roiwatch
