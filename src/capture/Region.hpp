#pragma once

#include <optional>
#include <string>

#include "capture/CaptureTypes.hpp"

namespace roiwatch {

constexpr int kMinRegionSize = 10;

bool validateRegion(const Region& region, std::string* err);

// Intersection of `region` with `bounds`, or nullopt when they do not
// overlap.
std::optional<Region> intersectRegion(const Region& region,
                                      const Region& bounds);

bool containsRegion(const Region& outer, const Region& inner);

// Union of the monitor rectangles; {0,0,0,0} for an empty list.
Region boundsOfMonitors(const std::vector<MonitorInfo>& monitors);

std::string regionToString(const Region& region);

// Accepts "L,T,R,B" with non-negative integers.
bool parseRegion(const std::string& text, Region& out, std::string* err);

}  // namespace roiwatch
