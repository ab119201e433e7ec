#include <gtest/gtest.h>
#include "uploads/ThumbnailService.hpp"
#include "uploads/UrlResolver.hpp"
#include "uploads/PathNamer.hpp"
#include "uploads/Errors.hpp"
#include "cache/MemoryStore.hpp"
#include "preview/image.hpp"
#include "support/TempDir.hpp"
#include "support/fixtures.hpp"

using namespace ih;
using namespace ih::uploads;

class ThumbnailServiceTest : public ::testing::Test {
protected:
    test::TempDir tmp;
    test::Disks disks = test::makeDisks(tmp.path());
    std::shared_ptr<cache::MemoryStore> cache = std::make_shared<cache::MemoryStore>();
    std::shared_ptr<UrlResolver> urls;

    unsigned int codecCalls = 0;
    Codec countingCodec = [this](const std::vector<uint8_t>& bytes, const unsigned int w, const unsigned int h,
                                 const bool keepRatio) {
        ++codecCalls;
        return defaultCodec()(bytes, w, h, keepRatio);
    };

    model::Image cat;

    void SetUp() override {
        config::AppConfig app;
        app.url = "https://wiki.example.com";
        urls = std::make_shared<UrlResolver>(app, config::StorageConfig{});

        cat.id = 1;
        cat.name = "cat.png";
        cat.type = model::Type::Gallery;
        cat.path = "/uploads/images/gallery/2024-05/cat.png";
        disks.local->put(cat.path, test::makePng(400, 300));
    }

    [[nodiscard]] ThumbnailService service(Codec codec) const {
        return {disks.manager, cache, urls, std::move(codec)};
    }
};

TEST_F(ThumbnailServiceTest, VariantPathLayout) {
    EXPECT_EQ(ThumbnailService::thumbnailPath("/uploads/images/gallery/2024-05/cat.png", 100, 100, false),
              "/uploads/images/gallery/2024-05/thumbs-100-100/cat.png");
    EXPECT_EQ(ThumbnailService::thumbnailPath("/uploads/images/gallery/2024-05/cat.png", 1680, 0, true),
              "/uploads/images/gallery/2024-05/scaled-1680-0/cat.png");
    EXPECT_EQ(ThumbnailService::cacheKey(7, "/a/thumbs-1-1/b.png"), "images-7-/a/thumbs-1-1/b.png");
}

TEST_F(ThumbnailServiceTest, DerivesStoresAndCachesOnFirstRequest) {
    const auto svc = service(countingCodec);
    const auto url = svc.getThumbnail(cat, 100, 100);

    EXPECT_EQ(url, "https://wiki.example.com/uploads/images/gallery/2024-05/thumbs-100-100/cat.png");
    EXPECT_EQ(codecCalls, 1u);
    EXPECT_EQ(disks.local->putCalls, 2u);  // source from SetUp plus the variant
    EXPECT_EQ(disks.local->setPublicCalls, 1u);

    const auto stored = disks.local->get("/uploads/images/gallery/2024-05/thumbs-100-100/cat.png");
    const auto d = preview::image::dimensions(stored);
    EXPECT_EQ(d.width, 100);
    EXPECT_EQ(d.height, 100);

    EXPECT_EQ(cache->get(ThumbnailService::cacheKey(1, "/uploads/images/gallery/2024-05/thumbs-100-100/cat.png")),
              "/uploads/images/gallery/2024-05/thumbs-100-100/cat.png");
}

TEST_F(ThumbnailServiceTest, CacheHitSkipsStorageAndCodec) {
    const auto svc = service(countingCodec);
    const auto first = svc.getThumbnail(cat, 100, 100);

    const auto gets = disks.local->getCalls;
    const auto checks = disks.local->existsCalls;
    const auto second = svc.getThumbnail(cat, 100, 100);

    EXPECT_EQ(first, second);
    EXPECT_EQ(codecCalls, 1u);
    EXPECT_EQ(disks.local->getCalls, gets);
    EXPECT_EQ(disks.local->existsCalls, checks);
}

TEST_F(ThumbnailServiceTest, StoredVariantRepopulatesCache) {
    (void)service(countingCodec).getThumbnail(cat, 100, 100);
    cache->forget(ThumbnailService::cacheKey(1, "/uploads/images/gallery/2024-05/thumbs-100-100/cat.png"));

    const auto gets = disks.local->getCalls;
    const auto url = service(countingCodec).getThumbnail(cat, 100, 100);

    EXPECT_EQ(url, "https://wiki.example.com/uploads/images/gallery/2024-05/thumbs-100-100/cat.png");
    EXPECT_EQ(codecCalls, 1u);
    EXPECT_EQ(disks.local->getCalls, gets);
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(ThumbnailServiceTest, KeepRatioUsesScaledFolder) {
    const auto url = service(countingCodec).getThumbnail(cat, 200, 0, true);
    EXPECT_EQ(url, "https://wiki.example.com/uploads/images/gallery/2024-05/scaled-200-0/cat.png");
    const auto d = preview::image::dimensions(disks.local->get("/uploads/images/gallery/2024-05/scaled-200-0/cat.png"));
    EXPECT_EQ(d.width, 200);
    EXPECT_EQ(d.height, 150);
}

TEST_F(ThumbnailServiceTest, AnimatedGifKeepRatioReturnsSource) {
    model::Image gif = cat;
    gif.path = "/uploads/images/gallery/2024-05/dance.GIF";

    const auto url = service(countingCodec).getThumbnail(gif, 100, 100, true);

    EXPECT_EQ(url, "https://wiki.example.com/uploads/images/gallery/2024-05/dance.GIF");
    EXPECT_EQ(codecCalls, 0u);
    EXPECT_EQ(disks.local->existsCalls, 0u);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ThumbnailServiceTest, LargerScaledOutputStoresSourceBytes) {
    const Codec inflate = [](const std::vector<uint8_t>& bytes, unsigned int, unsigned int, bool) {
        auto out = bytes;
        out.resize(bytes.size() * 2, 0);
        return out;
    };

    (void)service(inflate).getThumbnail(cat, 50, 50, true);
    EXPECT_EQ(disks.local->get("/uploads/images/gallery/2024-05/scaled-50-50/cat.png"), disks.local->get(cat.path));
}

TEST_F(ThumbnailServiceTest, UndecodableSourceRaisesDerivationError) {
    model::Image svg = cat;
    svg.id = 2;
    svg.path = "/uploads/images/gallery/2024-05/logo.svg";
    disks.local->put(svg.path, std::vector<uint8_t>(128, '<'));

    EXPECT_THROW((void)service(defaultCodec()).getThumbnail(svg, 100, 100), DerivationError);
    EXPECT_FALSE(disks.local->exists("/uploads/images/gallery/2024-05/thumbs-100-100/logo.svg"));
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ThumbnailServiceTest, MissingSourcePropagatesNotFound) {
    model::Image gone = cat;
    gone.path = "/uploads/images/gallery/2024-05/gone.png";
    EXPECT_THROW((void)service(countingCodec).getThumbnail(gone, 100, 100), storage::NotFound);
    EXPECT_EQ(codecCalls, 0u);
}

TEST_F(ThumbnailServiceTest, FailedWriteLeavesCacheEmpty) {
    disks.local->failWrites = true;
    EXPECT_THROW((void)service(countingCodec).getThumbnail(cat, 100, 100), std::runtime_error);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(ThumbnailServiceTest, LongUploadNameDerivesAndCaches) {
    const PathNamer namer;
    model::Image longName = cat;
    longName.id = 3;
    longName.name = std::string(250, 'x') + ".png";
    longName.path = namer.newSourcePath(longName.name, model::Type::Gallery,
                                        [this](const std::string& p) { return disks.local->exists(p); });
    disks.local->put(longName.path, test::makePng(40, 30));

    const auto url = service(countingCodec).getThumbnail(longName, 20, 20);

    const auto thumbPath = ThumbnailService::thumbnailPath(longName.path, 20, 20, false);
    const auto key = ThumbnailService::cacheKey(3, thumbPath);
    EXPECT_EQ(url, "https://wiki.example.com" + thumbPath);
    EXPECT_EQ(cache->get(key), thumbPath);
    EXPECT_LT(key.size(), 255u);
}
