#pragma once

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace ih::preview::image {

// Source bytes are not an image this codec can decode.
struct UnsupportedFormat : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Dimensions {
    int width{}, height{};
};

[[nodiscard]] Dimensions dimensions(const std::vector<uint8_t>& bytes);

void compress_to_jpeg(const uint8_t* rgb_data, int width, int height, std::vector<uint8_t>& out_buf, int quality = 85);

[[nodiscard]] std::vector<uint8_t> encodePng(const uint8_t* pixels, int width, int height, int channels);

/**
 * Resizes an encoded image.
 *
 * keepRatio: scale into the width x height box preserving aspect, never upsizing; a 0 side is
 * unconstrained. Otherwise crop from the centre and scale to exactly width x height; a 0 side
 * takes the other side's value.
 *
 * JPEG input is re-encoded as JPEG, everything else as PNG. Throws UnsupportedFormat when the
 * input cannot be decoded.
 */
[[nodiscard]] std::vector<uint8_t> resize(const std::vector<uint8_t>& bytes, unsigned int width, unsigned int height,
                                          bool keepRatio);

}
