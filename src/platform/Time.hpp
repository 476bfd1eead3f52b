#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace roiwatch {

using WallClock = std::chrono::system_clock;
using Timestamp = WallClock::time_point;

inline double nowSeconds() {
    using clock = std::chrono::steady_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

inline Timestamp wallNow() {
    return WallClock::now();
}

// "YYYY-MM-DD HH:MM:SS" in local time.
inline std::string formatTimestamp(Timestamp t) {
    std::time_t secs = WallClock::to_time_t(t);
    std::tm tm{};
    localtime_r(&secs, &tm);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
        return {};
    }
    return buf;
}

}  // namespace roiwatch
