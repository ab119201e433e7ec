#include <gtest/gtest.h>
#include "storage/Manager.hpp"
#include "storage/LocalEngine.hpp"
#include "config/Config.hpp"
#include "support/TempDir.hpp"

using namespace ih;
using namespace ih::storage;
using ih::uploads::model::Type;

class ManagerTest : public ::testing::Test {
protected:
    test::TempDir tmp;

    config::StorageConfig cfg(const std::string& images) const {
        config::StorageConfig c;
        c.images = images;
        c.local.public_root = tmp.path() / "public";
        c.local.secure_root = tmp.path() / "secure";
        return c;
    }
};

TEST_F(ManagerTest, DefaultDiskServesEveryType) {
    const auto m = Manager::fromConfig(cfg("local"));
    for (const auto t : {Type::Gallery, Type::Drawio, Type::User, Type::System, Type::Cover})
        EXPECT_EQ(m->diskNameFor(t), "local");
}

TEST_F(ManagerTest, SystemImagesLeaveSecureDisk) {
    const auto m = Manager::fromConfig(cfg("local_secure"));
    EXPECT_EQ(m->diskNameFor(Type::Gallery), "local_secure");
    EXPECT_EQ(m->diskNameFor(Type::System), "local");
    EXPECT_NE(m->forType(Type::System), m->forType(Type::Gallery));
}

TEST_F(ManagerTest, S3WithoutBucketIsRejected) {
    EXPECT_THROW((void)Manager::fromConfig(cfg("s3")), std::invalid_argument);
}

TEST_F(ManagerTest, UnknownDefaultDiskIsRejected) {
    EXPECT_THROW((void)Manager::fromConfig(cfg("ftp")), std::invalid_argument);
}

TEST_F(ManagerTest, UnknownDiskLookupThrows) {
    const auto m = Manager::fromConfig(cfg("local"));
    EXPECT_THROW((void)m->disk("s3"), std::invalid_argument);
    EXPECT_EQ(m->disk("local"), m->forType(Type::Gallery));
}
