#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_RESIZE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "preview/image.hpp"
#include "log/Registry.hpp"

#include <stb/stb_image.h>
#include <stb/stb_image_resize.h>
#include <stb/stb_image_write.h>
#include <turbojpeg.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <string>
#include <tuple>

namespace ih::preview::image {

namespace {

struct StbiDeleter {
    void operator()(unsigned char* p) const { stbi_image_free(p); }
};

using Pixels = std::unique_ptr<unsigned char, StbiDeleter>;

bool isJpeg(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF;
}

struct Box {
    int x{}, y{}, w{}, h{};
};

// Output size for keep-ratio mode; never larger than the source.
std::pair<int, int> scaledSize(const int srcW, const int srcH, const unsigned int width, const unsigned int height) {
    double ratio = 1.0;
    if (width) ratio = std::min(ratio, static_cast<double>(width) / srcW);
    if (height) ratio = std::min(ratio, static_cast<double>(height) / srcH);
    return {
        std::max(1, static_cast<int>(std::lround(srcW * ratio))),
        std::max(1, static_cast<int>(std::lround(srcH * ratio)))
    };
}

// Centred source region with the target's aspect ratio.
Box cropFor(const int srcW, const int srcH, const int dstW, const int dstH) {
    const double scale = std::max(static_cast<double>(dstW) / srcW, static_cast<double>(dstH) / srcH);
    Box b;
    b.w = std::clamp(static_cast<int>(std::lround(dstW / scale)), 1, srcW);
    b.h = std::clamp(static_cast<int>(std::lround(dstH / scale)), 1, srcH);
    b.x = (srcW - b.w) / 2;
    b.y = (srcH - b.h) / 2;
    return b;
}

}

Dimensions dimensions(const std::vector<uint8_t>& bytes) {
    Dimensions d;
    int channels = 0;
    if (bytes.empty() || !stbi_info_from_memory(bytes.data(), static_cast<int>(bytes.size()), &d.width, &d.height, &channels))
        throw UnsupportedFormat("Unrecognised image data");
    return d;
}

void compress_to_jpeg(const uint8_t* rgb_data, const int width, const int height, std::vector<uint8_t>& out_buf,
                      const int quality) {
    tjhandle tj = tjInitCompress();
    if (!tj) throw std::runtime_error("Failed to initialize TurboJPEG compressor");

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;

    if (tjCompress2(tj, rgb_data, width, 0, height, TJPF_RGB, &jpeg_buf, &jpeg_size,
                    TJSAMP_420, quality, 0) != 0) {
        const std::string err = tjGetErrorStr();
        tjDestroy(tj);
        throw std::runtime_error("JPEG compression failed: " + err);
    }

    out_buf.assign(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(tj);
}

std::vector<uint8_t> encodePng(const uint8_t* pixels, const int width, const int height, const int channels) {
    std::vector<uint8_t> out;
    const auto write = [](void* ctx, void* data, const int size) {
        auto* buf = static_cast<std::vector<uint8_t>*>(ctx);
        const auto* p = static_cast<const uint8_t*>(data);
        buf->insert(buf->end(), p, p + size);
    };
    if (!stbi_write_png_to_func(write, &out, width, height, channels, pixels, width * channels))
        throw std::runtime_error("PNG encoding failed");
    return out;
}

std::vector<uint8_t> resize(const std::vector<uint8_t>& bytes, unsigned int width, unsigned int height,
                            const bool keepRatio) {
    if (bytes.size() < 4) throw UnsupportedFormat("Buffer too small to be a valid image");

    const bool jpeg = isJpeg(bytes);
    int srcW = 0, srcH = 0, srcChannels = 0;
    const int wanted = jpeg ? 3 : 0;
    Pixels decoded(stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()), &srcW, &srcH, &srcChannels, wanted));
    if (!decoded) {
        const char* reason = stbi_failure_reason();
        throw UnsupportedFormat(std::string("Failed to decode image: ") + (reason ? reason : "unknown error"));
    }
    const int channels = jpeg ? 3 : srcChannels;

    int dstW = 0, dstH = 0;
    Box crop{0, 0, srcW, srcH};

    if (keepRatio) {
        std::tie(dstW, dstH) = scaledSize(srcW, srcH, width, height);
    } else {
        if (!width && !height) throw std::invalid_argument("Fit resize requires a width or a height");
        if (!width) width = height;
        if (!height) height = width;
        dstW = static_cast<int>(width);
        dstH = static_cast<int>(height);
        crop = cropFor(srcW, srcH, dstW, dstH);
    }

    const unsigned char* origin = decoded.get() + (static_cast<size_t>(crop.y) * srcW + crop.x) * channels;
    std::vector<uint8_t> resized(static_cast<size_t>(dstW) * dstH * channels);
    if (!stbir_resize_uint8(origin, crop.w, crop.h, srcW * channels, resized.data(), dstW, dstH, 0, channels))
        throw std::runtime_error("Image resize failed");

    log::Registry::thumb()->trace("[preview::image] {}x{} -> {}x{} ({})", srcW, srcH, dstW, dstH, jpeg ? "jpeg" : "png");

    if (jpeg) {
        std::vector<uint8_t> compressed;
        compress_to_jpeg(resized.data(), dstW, dstH, compressed);
        return compressed;
    }
    return encodePng(resized.data(), dstW, dstH, channels);
}

}
