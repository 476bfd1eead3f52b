#include "capture/Region.hpp"

#include <algorithm>
#include <climits>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace roiwatch {

bool validateRegion(const Region& region, std::string* err) {
    if (region.right <= region.left || region.bottom <= region.top) {
        if (err) {
            *err = "region " + regionToString(region) +
                   " must have right > left and bottom > top";
        }
        return false;
    }
    // Extents must fit in an int before width()/height() may be used.
    const long long w = static_cast<long long>(region.right) - region.left;
    const long long h = static_cast<long long>(region.bottom) - region.top;
    if (w > INT_MAX || h > INT_MAX) {
        if (err) {
            *err = "region " + regionToString(region) + " is too large";
        }
        return false;
    }
    if (w < kMinRegionSize || h < kMinRegionSize) {
        if (err) {
            *err = "region " + regionToString(region) + " is smaller than " +
                   std::to_string(kMinRegionSize) + "x" +
                   std::to_string(kMinRegionSize);
        }
        return false;
    }
    return true;
}

std::optional<Region> intersectRegion(const Region& region,
                                      const Region& bounds) {
    Region out;
    out.left = std::max(region.left, bounds.left);
    out.top = std::max(region.top, bounds.top);
    out.right = std::min(region.right, bounds.right);
    out.bottom = std::min(region.bottom, bounds.bottom);
    if (out.right <= out.left || out.bottom <= out.top) {
        return std::nullopt;
    }
    return out;
}

bool containsRegion(const Region& outer, const Region& inner) {
    return inner.left >= outer.left && inner.top >= outer.top &&
           inner.right <= outer.right && inner.bottom <= outer.bottom;
}

Region boundsOfMonitors(const std::vector<MonitorInfo>& monitors) {
    bool hasBounds = false;
    Region out;
    for (const auto& mon : monitors) {
        if (mon.w <= 0 || mon.h <= 0) {
            continue;
        }
        Region r{mon.x, mon.y, mon.x + mon.w, mon.y + mon.h};
        if (!hasBounds) {
            out = r;
            hasBounds = true;
        } else {
            out.left = std::min(out.left, r.left);
            out.top = std::min(out.top, r.top);
            out.right = std::max(out.right, r.right);
            out.bottom = std::max(out.bottom, r.bottom);
        }
    }
    return out;
}

std::string regionToString(const Region& region) {
    std::ostringstream os;
    os << "[" << region.left << "," << region.top << "," << region.right
       << "," << region.bottom << "]";
    return os.str();
}

bool parseRegion(const std::string& text, Region& out, std::string* err) {
    std::vector<int> values;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        char* end = nullptr;
        long v = std::strtol(part.c_str(), &end, 10);
        if (part.empty() || !end || *end != '\0' || v < 0 ||
            v > INT_MAX) {
            if (err) {
                *err = "invalid region component '" + part +
                       "' (expected an integer from 0 to " +
                       std::to_string(INT_MAX) + ")";
            }
            return false;
        }
        values.push_back(static_cast<int>(v));
    }
    if (values.size() != 4) {
        if (err) {
            *err = "region must be left,top,right,bottom";
        }
        return false;
    }
    out = Region{values[0], values[1], values[2], values[3]};
    return true;
}

}  // namespace roiwatch
