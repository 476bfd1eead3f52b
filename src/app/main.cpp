#include <sys/stat.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "app/cli.hpp"
#include "capture/BackendFactory.hpp"
#include "capture/CaptureChain.hpp"
#include "capture/CaptureTypes.hpp"
#include "capture/Region.hpp"
#include "detect/DetectorFactory.hpp"
#include "monitor/EventBus.hpp"
#include "monitor/RoiMonitor.hpp"
#include "platform/Capabilities.hpp"
#include "platform/FileUtil.hpp"
#include "platform/Log.hpp"
#include "platform/Time.hpp"

namespace roiwatch {

namespace {

volatile std::sig_atomic_t g_stopSignal = 0;

void onSignal(int sig) {
    g_stopSignal = sig;
}

bool installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGINT, &sa, nullptr) != 0 ||
        sigaction(SIGTERM, &sa, nullptr) != 0) {
        LOG_ERROR("sigaction failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

bool ensureDirectory(const std::string& path) {
    if (::mkdir(path.c_str(), 0755) == 0 || errno == EEXIST) {
        struct stat st {};
        if (::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
            return true;
        }
    }
    LOG_ERROR("cannot use output directory %s: %s", path.c_str(),
              std::strerror(errno));
    return false;
}

void printMonitorList(const CaptureChain& chain,
                      const std::vector<MonitorInfo>& monitors) {
    std::cout << "Capture chain:";
    for (const auto& info : chain.chainInfo()) {
        std::cout << " " << info.name;
    }
    std::cout << "\n";
    if (monitors.empty()) {
        std::cout << "(no monitors reported)\n";
        return;
    }
    for (size_t i = 0; i < monitors.size(); ++i) {
        const auto& m = monitors[i];
        std::cout << "[" << i << "] " << m.name << " " << m.x << "," << m.y
                  << " " << m.w << "x" << m.h << " scale=" << m.scale;
        if (m.primary) {
            std::cout << " primary";
        }
        std::cout << "\n";
    }
}

void logEvent(const Event& event) {
    const std::string when = formatTimestamp(event.timestamp);
    if (auto* e = std::get_if<MonitoringStartedEvent>(&event.payload)) {
        LOG_INFO("[%s] monitoring %s with %s", when.c_str(),
                 regionToString(e->region).c_str(), e->strategy.c_str());
    } else if (auto* e = std::get_if<MonitoringStoppedEvent>(&event.payload)) {
        LOG_INFO("[%s] monitoring stopped: %s", when.c_str(),
                 e->reason.c_str());
    } else if (auto* e = std::get_if<ChangeDetectedEvent>(&event.payload)) {
        LOG_INFO("[%s] change #%llu: %s magnitude %.2f", when.c_str(),
                 static_cast<unsigned long long>(e->changeNumber),
                 e->verdict.strategy.c_str(), e->verdict.magnitude);
    } else if (auto* e = std::get_if<CaptureFailedEvent>(&event.payload)) {
        LOG_WARN("[%s] capture failed (%d in a row): %s", when.c_str(),
                 e->consecutiveFailures, e->error.message.c_str());
    } else if (auto* e = std::get_if<StrategyChangedEvent>(&event.payload)) {
        LOG_INFO("[%s] strategy %s -> %s", when.c_str(),
                 e->oldStrategy.c_str(), e->newStrategy.c_str());
    }
}

void printStatus(const MonitorStatus& st) {
    std::cout << "session " << st.sessionId << ": "
              << monitorStateToString(st.state) << "\n"
              << "  region      " << regionToString(st.region) << "\n"
              << "  strategy    " << st.strategy << " (threshold "
              << st.threshold << ")\n"
              << "  ticks       " << st.ticks << "\n"
              << "  changes     " << st.changesDetected << "\n"
              << "  errors      " << st.totalCaptureErrors << "\n"
              << "  avg cycle   " << st.avgCycleMs << " ms\n";
    if (!st.lastError.empty()) {
        std::cout << "  last error  " << st.lastError << "\n";
    }
}

int forceCaptureToFile(CaptureChain& chain, const std::string& path) {
    EventBus bus;
    RoiMonitor monitor(chain, bus);
    FramePtr frame;
    MonitorError err;
    if (!monitor.forceCapture(frame, &err)) {
        LOG_ERROR("capture failed: %s", err.message.c_str());
        return 1;
    }
    std::string writeErr;
    if (!writeFileBytes(path, frame->bytes, &writeErr)) {
        LOG_ERROR("%s", writeErr.c_str());
        return 1;
    }
    LOG_INFO("wrote %dx%d capture from %s to %s", frame->width, frame->height,
             frame->strategy.c_str(), path.c_str());
    return 0;
}

int runMonitor(CaptureChain& chain, const CliOptions& options) {
    if (options.outputDir && !ensureDirectory(*options.outputDir)) {
        return 1;
    }
    if (!installSignalHandlers()) {
        return 1;
    }

    EventBus bus;
    bus.subscribeAll(logEvent);
    if (options.outputDir) {
        const std::string dir = *options.outputDir;
        bus.subscribe(EventType::ChangeDetected, [dir](const Event& event) {
            const auto& e = std::get<ChangeDetectedEvent>(event.payload);
            const std::string path =
                dir + "/change-" + std::to_string(e.changeNumber) + ".png";
            std::string err;
            if (!writeFileBytes(path, e.frame->bytes, &err)) {
                LOG_ERROR("%s", err.c_str());
                return;
            }
            LOG_DEBUG("saved %s", path.c_str());
        });
    }

    RoiMonitor monitor(chain, bus);
    MonitorConfig config;
    config.region = options.region;
    config.strategy = options.strategy;
    config.threshold = options.threshold;
    config.intervalMs = options.intervalMs;

    std::string sessionId;
    MonitorError err;
    if (!monitor.start(config, &sessionId, &err)) {
        LOG_ERROR("failed to start monitoring (%s): %s",
                  monitorErrorKindToString(err.kind).c_str(),
                  err.message.c_str());
        return 1;
    }

    using clock = std::chrono::steady_clock;
    const auto deadline =
        clock::now() + std::chrono::seconds(options.durationSec);
    std::string reason = "duration_elapsed";
    while (true) {
        if (g_stopSignal != 0) {
            reason = g_stopSignal == SIGTERM ? "sigterm" : "sigint";
            break;
        }
        if (monitor.state() == MonitorState::Failed) {
            break;
        }
        if (options.durationSec > 0 && clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    monitor.stop(reason);
    MonitorStatus st = monitor.status();
    printStatus(st);
    return st.state == MonitorState::Failed ? 1 : 0;
}

}  // namespace

}  // namespace roiwatch

int main(int argc, char** argv) {
    using namespace roiwatch;

    initFileLogging();

    CliOptions options;
    std::string err;
    if (!parseCli(argc, argv, options, err)) {
        LOG_ERROR("%s", err.c_str());
        printUsage(argv[0]);
        closeFileLogging();
        return 1;
    }
    if (options.help) {
        printUsage(argv[0]);
        closeFileLogging();
        return 0;
    }

    setDebugLogging(options.debug);

    if (options.listStrategies) {
        std::cout << describeDetectionKinds();
        closeFileLogging();
        return 0;
    }

    PlatformCapabilities caps = DetectPlatformCapabilities();
    LOG_DEBUG("platform: %s", describeCapabilities(caps).c_str());

    CaptureChainOptions chainOptions;
    chainOptions.captureTimeout =
        std::chrono::milliseconds(options.captureTimeoutMs);
    std::unique_ptr<CaptureChain> chain;
    if (options.backend == BackendKind::Auto) {
        chain = std::make_unique<CaptureChain>(caps, chainOptions);
    } else {
        chain = std::make_unique<CaptureChain>(caps, options.backend,
                                               chainOptions);
    }
    if (chain->size() == 0) {
        LOG_ERROR("no capture strategy is available on this platform");
        closeFileLogging();
        return 1;
    }

    int rc = 0;
    if (options.listMonitors) {
        printMonitorList(*chain, chain->listMonitors());
    } else if (options.forceCapturePath) {
        rc = forceCaptureToFile(*chain, *options.forceCapturePath);
    } else {
        rc = runMonitor(*chain, options);
    }

    closeFileLogging();
    return rc;
}
