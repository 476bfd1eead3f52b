#include "detect/DetectorFactory.hpp"

#include "detect/DetectorHash.hpp"
#include "detect/DetectorPixel.hpp"
#include "detect/DetectorSize.hpp"

namespace roiwatch {

std::unique_ptr<IChangeDetector> CreateDetector(DetectionKind kind) {
    switch (kind) {
        case DetectionKind::Size:
            return CreateDetectorSize();
        case DetectionKind::Pixel:
            return CreateDetectorPixel();
        case DetectionKind::Hash:
            return CreateDetectorHash();
    }
    return nullptr;
}

std::string detectionKindToString(DetectionKind kind) {
    switch (kind) {
        case DetectionKind::Size:
            return "size";
        case DetectionKind::Pixel:
            return "pixel";
        case DetectionKind::Hash:
            return "hash";
    }
    return "size";
}

bool parseDetectionKind(const std::string& text, DetectionKind& out) {
    if (text == "size") {
        out = DetectionKind::Size;
    } else if (text == "pixel") {
        out = DetectionKind::Pixel;
    } else if (text == "hash") {
        out = DetectionKind::Hash;
    } else {
        return false;
    }
    return true;
}

std::string describeDetectionKinds() {
    return "size   encoded size delta in percent, threshold 0-100 (fast, "
           "coarse)\n"
           "pixel  sampled mean RGB difference, threshold 0-100\n"
           "hash   exact payload hash match, threshold ignored\n";
}

}  // namespace roiwatch
