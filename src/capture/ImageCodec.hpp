#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "capture/CaptureTypes.hpp"

namespace roiwatch {

bool encodePng(const ImageRGBA& image, std::vector<std::uint8_t>& out,
               std::string* err);

// Decodes any format stb_image understands into 8-bit RGBA.
bool decodeImage(const std::uint8_t* data, size_t size, ImageRGBA& out,
                 std::string* err);

bool decodeImageFile(const std::string& path, ImageRGBA& out,
                     std::string* err);

// Copies `crop` out of `src`, whose pixels cover display area `srcArea`.
bool cropImage(const ImageRGBA& src, const Region& srcArea,
               const Region& crop, ImageRGBA& out);

bool isWellFormed(const ImageRGBA& image);

}  // namespace roiwatch
