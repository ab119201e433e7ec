#include "uploads/ThumbnailService.hpp"
#include "uploads/UrlResolver.hpp"
#include "storage/Manager.hpp"
#include "storage/Engine.hpp"
#include "cache/Store.hpp"
#include "util/slug.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace ih::log;

namespace ih::uploads {

ThumbnailService::ThumbnailService(std::shared_ptr<storage::Manager> storage,
                                   std::shared_ptr<cache::Store> cache,
                                   std::shared_ptr<UrlResolver> urls,
                                   Codec codec,
                                   const std::chrono::seconds ttl)
    : storage_(std::move(storage)), cache_(std::move(cache)), urls_(std::move(urls)),
      codec_(std::move(codec)), ttl_(ttl) {
    if (!storage_ || !cache_ || !urls_) throw std::invalid_argument("ThumbnailService requires storage, cache and URL resolver");
    if (!codec_) throw std::invalid_argument("ThumbnailService requires a codec");
}

std::string ThumbnailService::thumbnailPath(const std::string& sourcePath, const unsigned int width,
                                            const unsigned int height, const bool keepRatio) {
    const auto slash = sourcePath.find_last_of('/');
    const auto dir = slash == std::string::npos ? std::string{} : sourcePath.substr(0, slash);
    const auto file = slash == std::string::npos ? sourcePath : sourcePath.substr(slash + 1);
    return fmt::format("{}/{}{}-{}/{}", dir, keepRatio ? "scaled-" : "thumbs-", width, height, file);
}

std::string ThumbnailService::cacheKey(const unsigned int imageId, const std::string& thumbPath) {
    return fmt::format("images-{}-{}", imageId, thumbPath);
}

bool ThumbnailService::isAnimated(const model::Image& image) {
    return util::toLower(image.extension()) == "gif";
}

std::string ThumbnailService::getThumbnail(const model::Image& image, const unsigned int width,
                                           const unsigned int height, const bool keepRatio) const {
    if (keepRatio && isAnimated(image)) return urls_->toPublicUrl(image.path);

    const auto thumbPath = thumbnailPath(image.path, width, height, keepRatio);
    const auto key = cacheKey(image.id, thumbPath);

    if (cache_->has(key)) return urls_->toPublicUrl(thumbPath);

    const auto storage = storage_->forType(image.type);

    if (storage->exists(thumbPath)) {
        cache_->put(key, thumbPath, ttl_);
        return urls_->toPublicUrl(thumbPath);
    }

    Registry::thumb()->debug("[ThumbnailService] Deriving {} for image {}", thumbPath, image.id);

    const auto source = storage->get(image.path);
    const auto thumbData = resizeImage(codec_, source, width, height, keepRatio);

    storage->put(thumbPath, thumbData);
    storage->setPublic(thumbPath);
    cache_->put(key, thumbPath, ttl_);

    Registry::thumb()->info("[ThumbnailService] Stored {} ({} bytes)", thumbPath, thumbData.size());
    return urls_->toPublicUrl(thumbPath);
}

}
