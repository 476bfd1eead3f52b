#include "capture/ImageCodec.hpp"

#include <cstring>

// The build adds the stb directory to the include path.
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "capture/Region.hpp"

namespace roiwatch {

namespace {

void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(context);
    auto* bytes = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

}  // namespace

bool isWellFormed(const ImageRGBA& image) {
    return image.w > 0 && image.h > 0 &&
           image.rgba.size() == static_cast<size_t>(image.w) *
                                    static_cast<size_t>(image.h) * 4u;
}

bool encodePng(const ImageRGBA& image, std::vector<std::uint8_t>& out,
               std::string* err) {
    out.clear();
    if (!isWellFormed(image)) {
        if (err) {
            *err = "cannot encode malformed image";
        }
        return false;
    }
    int ok = stbi_write_png_to_func(appendToVector, &out, image.w, image.h, 4,
                                    image.rgba.data(), image.w * 4);
    if (!ok || out.empty()) {
        if (err) {
            *err = "png encoding failed";
        }
        return false;
    }
    return true;
}

bool decodeImage(const std::uint8_t* data, size_t size, ImageRGBA& out,
                 std::string* err) {
    if (!data || size == 0) {
        if (err) {
            *err = "empty image payload";
        }
        return false;
    }
    int w = 0;
    int h = 0;
    int n = 0;
    stbi_uc* pixels = stbi_load_from_memory(data, static_cast<int>(size), &w,
                                            &h, &n, 4);
    if (!pixels) {
        if (err) {
            const char* reason = stbi_failure_reason();
            *err = std::string("image decode failed: ") +
                   (reason ? reason : "unknown");
        }
        return false;
    }
    (void)n;
    out.w = w;
    out.h = h;
    out.rgba.assign(pixels,
                    pixels + static_cast<size_t>(w) * static_cast<size_t>(h) *
                                 4u);
    stbi_image_free(pixels);
    return true;
}

bool decodeImageFile(const std::string& path, ImageRGBA& out,
                     std::string* err) {
    int w = 0;
    int h = 0;
    int n = 0;
    stbi_uc* pixels = stbi_load(path.c_str(), &w, &h, &n, 4);
    if (!pixels) {
        if (err) {
            *err = "failed to load image " + path;
        }
        return false;
    }
    (void)n;
    out.w = w;
    out.h = h;
    out.rgba.assign(pixels,
                    pixels + static_cast<size_t>(w) * static_cast<size_t>(h) *
                                 4u);
    stbi_image_free(pixels);
    return true;
}

bool cropImage(const ImageRGBA& src, const Region& srcArea,
               const Region& crop, ImageRGBA& out) {
    if (!isWellFormed(src) || src.w != srcArea.width() ||
        src.h != srcArea.height() || !containsRegion(srcArea, crop) ||
        crop.width() <= 0 || crop.height() <= 0) {
        return false;
    }
    out.w = crop.width();
    out.h = crop.height();
    out.rgba.resize(static_cast<size_t>(out.w) * static_cast<size_t>(out.h) *
                    4u);
    const int offX = crop.left - srcArea.left;
    const int offY = crop.top - srcArea.top;
    const size_t rowBytes = static_cast<size_t>(out.w) * 4u;
    for (int y = 0; y < out.h; ++y) {
        const size_t srcIdx = (static_cast<size_t>(offY + y) *
                                   static_cast<size_t>(src.w) +
                               static_cast<size_t>(offX)) *
                              4u;
        std::memcpy(&out.rgba[static_cast<size_t>(y) * rowBytes],
                    &src.rgba[srcIdx], rowBytes);
    }
    return true;
}

}  // namespace roiwatch
