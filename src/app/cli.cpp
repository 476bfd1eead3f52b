#include "app/cli.hpp"

#include <cstdlib>
#include <iostream>

#include "capture/Region.hpp"
#include "detect/DetectorFactory.hpp"

namespace roiwatch {

namespace {

bool parseInt(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || value < -2147483647L || value > 2147483647L) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return *end == '\0';
}

}  // namespace

void printUsage(const char* exe) {
    std::cerr << "Usage: " << exe << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --region <L,T,R,B>     Region to watch in display pixels "
                 "(default: 100,100,800,800)\n"
              << "  --strategy <name>      Change detection: size|pixel|hash "
                 "(default: size)\n"
              << "  --threshold <0-100>    Change threshold (default: 20)\n"
              << "  --interval <ms>        Poll interval (default: 500)\n"
              << "  --backend <mode>       Capture backend: "
                 "auto|x11|wlr|portal|wsl (default: auto)\n"
              << "  --capture-timeout <ms> Per-attempt capture timeout "
                 "(default: 5000)\n"
              << "  --duration <s>         Stop after this many seconds "
                 "(default: 0, run until interrupted)\n"
              << "  --output-dir <dir>     Write change-<n>.png for every "
                 "detected change\n"
              << "  --force-capture <file> Capture the full display once "
                 "into a PNG and exit\n"
              << "  --list-monitors        List monitors visible to the "
                 "capture chain\n"
              << "  --list-strategies      List change detection "
                 "strategies\n"
              << "  --debug                Enable debug logging\n"
              << "  --help, -h             Show this help message\n";
}

bool parseCli(int argc, char** argv, CliOptions& out, std::string& err) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](std::string& val) {
            if (i + 1 >= argc) {
                err = arg + " requires a value";
                return false;
            }
            val = argv[++i];
            return true;
        };
        std::string val;
        if (arg == "--region") {
            if (!needValue(val)) {
                return false;
            }
            std::string reason;
            if (!parseRegion(val, out.region, &reason)) {
                err = "invalid region '" + val + "': " + reason;
                return false;
            }
        } else if (arg == "--strategy") {
            if (!needValue(val)) {
                return false;
            }
            if (!parseDetectionKind(val, out.strategy)) {
                err = "unknown strategy: " + val;
                return false;
            }
        } else if (arg == "--threshold") {
            if (!needValue(val)) {
                return false;
            }
            if (!parseDouble(val, out.threshold) || out.threshold < 0.0) {
                err = "invalid threshold: " + val;
                return false;
            }
        } else if (arg == "--interval") {
            if (!needValue(val)) {
                return false;
            }
            if (!parseInt(val, out.intervalMs) || out.intervalMs <= 0) {
                err = "invalid interval: " + val;
                return false;
            }
        } else if (arg == "--backend") {
            if (!needValue(val)) {
                return false;
            }
            if (!parseBackendKind(val, out.backend)) {
                err = "unknown backend: " + val;
                return false;
            }
        } else if (arg == "--capture-timeout") {
            if (!needValue(val)) {
                return false;
            }
            if (!parseInt(val, out.captureTimeoutMs) ||
                out.captureTimeoutMs <= 0) {
                err = "invalid capture timeout: " + val;
                return false;
            }
        } else if (arg == "--duration") {
            if (!needValue(val)) {
                return false;
            }
            if (!parseInt(val, out.durationSec) || out.durationSec < 0) {
                err = "invalid duration: " + val;
                return false;
            }
        } else if (arg == "--output-dir") {
            if (!needValue(val)) {
                return false;
            }
            out.outputDir = val;
        } else if (arg == "--force-capture") {
            if (!needValue(val)) {
                return false;
            }
            out.forceCapturePath = val;
        } else if (arg == "--list-monitors") {
            out.listMonitors = true;
        } else if (arg == "--list-strategies") {
            out.listStrategies = true;
        } else if (arg == "--debug") {
            out.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else {
            err = "unknown argument: " + arg;
            return false;
        }
    }
    return true;
}

}  // namespace roiwatch
