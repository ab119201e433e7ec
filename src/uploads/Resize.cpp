#include "uploads/Resize.hpp"
#include "uploads/Errors.hpp"
#include "preview/image.hpp"
#include "log/Registry.hpp"

namespace ih::uploads {

Codec defaultCodec() {
    return [](const std::vector<uint8_t>& bytes, const unsigned int width, const unsigned int height,
              const bool keepRatio) {
        return preview::image::resize(bytes, width, height, keepRatio);
    };
}

std::vector<uint8_t> resizeImage(const Codec& codec, const std::vector<uint8_t>& data,
                                 const unsigned int width, const unsigned int height, const bool keepRatio) {
    std::vector<uint8_t> out;
    try {
        out = codec(data, width, height, keepRatio);
    } catch (const preview::image::UnsupportedFormat& e) {
        log::Registry::thumb()->warn("[Resize] Unsupported source image: {}", e.what());
        throw DerivationError(e.what());
    }

    if (keepRatio && out.size() > data.size()) {
        log::Registry::thumb()->debug("[Resize] Resized output ({} bytes) larger than source ({} bytes), keeping source",
                                      out.size(), data.size());
        return data;
    }

    return out;
}

}
