#pragma once

#include "preview/image.hpp"
#include "storage/LocalEngine.hpp"
#include "storage/Manager.hpp"
#include "support/CountingEngine.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace ih::test {

// Horizontal gradient so encoders cannot collapse the image to nothing.
inline std::vector<uint8_t> pixels(const int width, const int height, const int channels) {
    std::vector<uint8_t> px(static_cast<size_t>(width) * height * channels);
    for (int y = 0; y < height; ++y)
        for (int x = 0; x < width; ++x)
            for (int c = 0; c < channels; ++c)
                px[(static_cast<size_t>(y) * width + x) * channels + c] = static_cast<uint8_t>((x * 255 / width + c * 40) % 256);
    return px;
}

inline std::vector<uint8_t> makePng(const int width, const int height) {
    const auto px = pixels(width, height, 4);
    return preview::image::encodePng(px.data(), width, height, 4);
}

inline std::vector<uint8_t> makeJpeg(const int width, const int height) {
    const auto px = pixels(width, height, 3);
    std::vector<uint8_t> out;
    preview::image::compress_to_jpeg(px.data(), width, height, out, 90);
    return out;
}

struct Disks {
    std::shared_ptr<CountingEngine> local, secure;
    std::shared_ptr<storage::Manager> manager;
};

// "local" and "local_secure" disks under root, each wrapped in a counter.
inline Disks makeDisks(const std::filesystem::path& root, const std::string& defaultDisk = "local") {
    Disks d;
    d.local = std::make_shared<CountingEngine>(std::make_shared<storage::LocalEngine>(root / "public"));
    d.secure = std::make_shared<CountingEngine>(std::make_shared<storage::LocalEngine>(root / "secure"));
    d.manager = std::make_shared<storage::Manager>(
        defaultDisk, std::unordered_map<std::string, std::shared_ptr<storage::Engine>>{
                         {"local", d.local}, {"local_secure", d.secure}});
    return d;
}

}
