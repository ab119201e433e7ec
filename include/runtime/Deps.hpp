#pragma once

#include <memory>

namespace ih::storage { class Manager; }
namespace ih::cache { class Store; }
namespace ih::uploads {
class UrlResolver;
class ImageStore;
class ContentIndex;
class ThumbnailService;
class CleanupService;
class ImageService;
}

namespace ih::runtime {

// Process-wide object graph, built once from ConfigRegistry after the database pool is up.
struct Deps {
    std::shared_ptr<storage::Manager> storageManager;
    std::shared_ptr<cache::Store> cache;
    std::shared_ptr<uploads::UrlResolver> urlResolver;
    std::shared_ptr<uploads::ImageStore> imageStore;
    std::shared_ptr<uploads::ContentIndex> contentIndex;
    std::shared_ptr<uploads::ThumbnailService> thumbnailService;
    std::shared_ptr<uploads::CleanupService> cleanupService;
    std::shared_ptr<uploads::ImageService> imageService;

    Deps(const Deps&) = delete;
    Deps& operator=(const Deps&) = delete;

    static Deps& get();

    static void init();

private:
    Deps() = default;
};

}
