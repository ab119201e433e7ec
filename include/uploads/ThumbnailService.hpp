#pragma once

#include "uploads/Resize.hpp"
#include "uploads/model/Image.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace ih::storage { class Manager; }
namespace ih::cache { class Store; }

namespace ih::uploads {

class UrlResolver;

/**
 * Serves resized variants of source images. A variant's storage path is derived from the
 * source path and the requested box, so no lookup table is needed:
 *
 *   <source dir>/thumbs-<w>-<h>/<source file>   (crop to fill)
 *   <source dir>/scaled-<w>-<h>/<source file>   (keep ratio)
 *
 * Existence is remembered positively in the cache; a cache miss always falls through to storage.
 * Concurrent requests for the same missing variant may both derive it; the last whole-object
 * write wins.
 */
class ThumbnailService {
public:
    static constexpr auto DEFAULT_TTL = std::chrono::hours(72);

    ThumbnailService(std::shared_ptr<storage::Manager> storage,
                     std::shared_ptr<cache::Store> cache,
                     std::shared_ptr<UrlResolver> urls,
                     Codec codec = defaultCodec(),
                     std::chrono::seconds ttl = DEFAULT_TTL);

    [[nodiscard]] std::string getThumbnail(const model::Image& image, unsigned int width, unsigned int height,
                                           bool keepRatio = false) const;

    [[nodiscard]] static std::string thumbnailPath(const std::string& sourcePath, unsigned int width,
                                                   unsigned int height, bool keepRatio);

    [[nodiscard]] static std::string cacheKey(unsigned int imageId, const std::string& thumbPath);

private:
    std::shared_ptr<storage::Manager> storage_;
    std::shared_ptr<cache::Store> cache_;
    std::shared_ptr<UrlResolver> urls_;
    Codec codec_;
    std::chrono::seconds ttl_;

    // Resizing would drop the animation.
    [[nodiscard]] static bool isAnimated(const model::Image& image);
};

}
