#include <gtest/gtest.h>
#include "uploads/CleanupService.hpp"
#include "support/InMemoryContentIndex.hpp"
#include "support/InMemoryImageStore.hpp"
#include "support/TempDir.hpp"
#include "support/fixtures.hpp"

#include <algorithm>

using namespace ih;
using namespace ih::uploads;

namespace {

const std::string kDir = "/uploads/images/gallery/2024-05";
const std::vector<uint8_t> kBytes = {1, 2, 3, 4};

}

class CleanupServiceTest : public ::testing::Test {
protected:
    test::TempDir tmp;
    test::Disks disks = test::makeDisks(tmp.path());
    std::shared_ptr<test::InMemoryImageStore> images = std::make_shared<test::InMemoryImageStore>();
    std::shared_ptr<test::InMemoryContentIndex> content = std::make_shared<test::InMemoryContentIndex>();

    [[nodiscard]] CleanupService service(const unsigned int batchSize = CleanupService::DEFAULT_BATCH_SIZE) const {
        return {disks.manager, images, content, batchSize};
    }

    ImageStore::ImagePtr addImage(const std::string& file, const model::Type type = model::Type::Gallery,
                                  const std::string& dir = kDir) {
        model::Image fields;
        fields.name = file;
        fields.path = dir + "/" + file;
        fields.type = type;
        disks.local->put(fields.path, kBytes);
        return images->create(fields);
    }

    [[nodiscard]] bool stored(const std::string& path) const { return disks.local->exists(path); }

    static std::vector<std::string> sorted(std::vector<std::string> v) {
        std::ranges::sort(v);
        return v;
    }
};

TEST_F(CleanupServiceTest, DestroyRemovesSourceAndVariants) {
    const auto cat = addImage("cat.png");
    addImage("bobcat.png");
    disks.local->put(kDir + "/thumbs-100-100/cat.png", kBytes);
    disks.local->put(kDir + "/thumbs-100-100/bobcat.png", kBytes);
    disks.local->put(kDir + "/scaled-1680-0/cat.png", kBytes);

    service().destroy(*cat);

    EXPECT_FALSE(stored(kDir + "/cat.png"));
    EXPECT_FALSE(stored(kDir + "/thumbs-100-100/cat.png"));
    EXPECT_FALSE(stored(kDir + "/scaled-1680-0/cat.png"));
    EXPECT_FALSE(stored(kDir + "/scaled-1680-0"));

    EXPECT_TRUE(stored(kDir + "/bobcat.png"));
    EXPECT_TRUE(stored(kDir + "/thumbs-100-100/bobcat.png"));

    EXPECT_EQ(images->find(cat->id), nullptr);
    EXPECT_EQ(images->size(), 1u);
}

TEST_F(CleanupServiceTest, DestroyLastImageRemovesItsDirectory) {
    const auto only = addImage("only.png", model::Type::Gallery, "/uploads/images/gallery/2023-01");
    disks.local->put("/uploads/images/gallery/2023-01/thumbs-10-10/only.png", kBytes);

    service().destroy(*only);

    EXPECT_FALSE(stored("/uploads/images/gallery/2023-01"));
    EXPECT_TRUE(stored("/uploads/images/gallery"));
}

TEST_F(CleanupServiceTest, DestroyFailureKeepsRecord) {
    const auto cat = addImage("cat.png");
    disks.local->failRemoves = true;

    EXPECT_THROW(service().destroy(*cat), std::runtime_error);
    EXPECT_NE(images->find(cat->id), nullptr);
    EXPECT_TRUE(stored(cat->path));
}

TEST_F(CleanupServiceTest, DryRunReportsWithoutDeleting) {
    addImage("used.png");
    addImage("orphan.png");
    content->pages = {R"(<p><img src="https://wiki.example.com/uploads/images/gallery/2024-05/used.png"></p>)"};

    const auto found = service().sweep();

    EXPECT_EQ(found, std::vector<std::string>{kDir + "/orphan.png"});
    EXPECT_TRUE(stored(kDir + "/orphan.png"));
    EXPECT_EQ(images->size(), 2u);
}

TEST_F(CleanupServiceTest, ForceDestroysOnlyUnreferenced) {
    addImage("used.png");
    const auto orphan = addImage("orphan.png");
    content->pages = {"<img src=\"/uploads/images/gallery/2024-05/used.png\">"};

    const auto found = service().sweep(true, false);

    EXPECT_EQ(found, std::vector<std::string>{kDir + "/orphan.png"});
    EXPECT_FALSE(stored(kDir + "/orphan.png"));
    EXPECT_TRUE(stored(kDir + "/used.png"));
    EXPECT_EQ(images->find(orphan->id), nullptr);
}

TEST_F(CleanupServiceTest, RevisionsProtectUnlessSkipped) {
    addImage("old.png");
    content->revisions = {"<img src=\"/uploads/images/gallery/2024-05/old.png\">"};

    EXPECT_TRUE(service().sweep(true, true).empty());
    EXPECT_EQ(service().sweep(false, true), std::vector<std::string>{kDir + "/old.png"});
}

TEST_F(CleanupServiceTest, RevisionsNotQueriedWhenSkipped) {
    addImage("old.png");
    (void)service().sweep(false, true);
    EXPECT_EQ(content->revisionQueries, 0u);
}

TEST_F(CleanupServiceTest, ProtectedTypesAreNeverSwept) {
    addImage("avatar.png", model::Type::User, "/uploads/images/user/2024-05");
    addImage("logo.png", model::Type::System, "/uploads/images/system/2024-05");
    addImage("cover.png", model::Type::Cover, "/uploads/images/cover/2024-05");

    const auto found = service().sweep(true, false, {model::Type::User, model::Type::System, model::Type::Cover});

    EXPECT_TRUE(found.empty());
    EXPECT_EQ(images->size(), 3u);
    EXPECT_TRUE(stored("/uploads/images/user/2024-05/avatar.png"));
}

TEST_F(CleanupServiceTest, DrawioIsSweepable) {
    addImage("diagram.png", model::Type::Drawio, "/uploads/images/drawio/2024-05");
    addImage("g.png");

    const auto found = service().sweep(true, true, {model::Type::Drawio});
    EXPECT_EQ(found, std::vector<std::string>{"/uploads/images/drawio/2024-05/diagram.png"});
}

TEST_F(CleanupServiceTest, SmallBatchesStillVisitEveryOrphan) {
    std::vector<std::string> expected;
    for (int i = 0; i < 7; ++i) {
        const auto img = addImage("orphan-" + std::to_string(i) + ".png");
        expected.push_back(img->path);
    }
    addImage("kept.png");
    content->pages = {"kept.png"};

    const auto found = service(2).sweep(true, false);

    EXPECT_EQ(sorted(found), sorted(expected));
    EXPECT_EQ(images->size(), 1u);
    EXPECT_GE(images->chunks, 4u);
}
