#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace ih::uploads {

using Codec = std::function<std::vector<uint8_t>(const std::vector<uint8_t>& bytes,
                                                 unsigned int width, unsigned int height, bool keepRatio)>;

// preview::image::resize
Codec defaultCodec();

/**
 * Runs the codec and applies the upload policy around it: an unsupported source becomes
 * DerivationError, and a keep-ratio result larger than its input is discarded in favour of
 * the original bytes.
 */
std::vector<uint8_t> resizeImage(const Codec& codec, const std::vector<uint8_t>& data,
                                 unsigned int width, unsigned int height, bool keepRatio);

}
