#include "runtime/Deps.hpp"
#include "config/ConfigRegistry.hpp"
#include "storage/Manager.hpp"
#include "cache/MemoryStore.hpp"
#include "cache/DatabaseStore.hpp"
#include "uploads/UrlResolver.hpp"
#include "uploads/DatabaseImageStore.hpp"
#include "uploads/DatabaseContentIndex.hpp"
#include "uploads/ThumbnailService.hpp"
#include "uploads/CleanupService.hpp"
#include "uploads/ImageService.hpp"
#include "log/Registry.hpp"

using namespace ih::runtime;
using namespace ih::uploads;

Deps& Deps::get() {
    static Deps instance_;
    return instance_;
}

static std::shared_ptr<ih::cache::Store> makeCache(const std::string& driver) {
    if (driver == "memory") return std::make_shared<ih::cache::MemoryStore>();
    if (driver == "database") return std::make_shared<ih::cache::DatabaseStore>();
    throw std::invalid_argument("Unknown cache driver: " + driver);
}

void Deps::init() {
    if (get().storageManager) {
        ih::log::Registry::imagehall()->warn("[Deps] Already initialized, ignoring second init()");
        return;
    }

    ih::log::Registry::imagehall()->info("[Deps] Initializing...");

    const auto& cfg = ih::config::ConfigRegistry::get();
    auto& ctx = get();

    ctx.storageManager = ih::storage::Manager::fromConfig(cfg.storage);
    ctx.cache = makeCache(cfg.cache.driver);
    ctx.urlResolver = std::make_shared<UrlResolver>(cfg.app, cfg.storage);
    ctx.imageStore = std::make_shared<DatabaseImageStore>();
    ctx.contentIndex = std::make_shared<DatabaseContentIndex>();

    ctx.thumbnailService = std::make_shared<ThumbnailService>(
        ctx.storageManager, ctx.cache, ctx.urlResolver, defaultCodec(),
        std::chrono::hours(cfg.thumbnails.cache_ttl_hours));

    ctx.cleanupService = std::make_shared<CleanupService>(
        ctx.storageManager, ctx.imageStore, ctx.contentIndex, cfg.cleanup.batch_size);

    ctx.imageService = std::make_shared<ImageService>(
        ctx.storageManager, ctx.imageStore, ctx.urlResolver, cfg.app, cfg.avatar);

    ih::log::Registry::imagehall()->info("[Deps] Initialized.");
}
