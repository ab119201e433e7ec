#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "support/TempDir.hpp"

#include <cstdlib>
#include <fstream>

using namespace ih::config;

class ConfigTest : public ::testing::Test {
protected:
    ih::test::TempDir tmp;

    std::filesystem::path write(const std::string& yaml) const {
        const auto path = tmp.path() / "config.yaml";
        std::ofstream(path) << yaml;
        return path;
    }

    void TearDown() override {
        unsetenv("IMAGEHALL_DB_PASSWORD");
        unsetenv("IMAGEHALL_S3_SECRET");
    }
};

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW((void)loadConfig(tmp.path() / "absent.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, EmptySectionsKeepDefaults) {
    const auto cfg = loadConfig(write("app:\n  url: \"https://wiki.example.com\"\n"));
    EXPECT_EQ(cfg.app.url, "https://wiki.example.com");
    EXPECT_FALSE(cfg.app.secure_images);
    EXPECT_EQ(cfg.storage.images, "local");
    EXPECT_EQ(cfg.thumbnails.cache_ttl_hours, 72u);
    EXPECT_EQ(cfg.cleanup.batch_size, 1000u);
    EXPECT_EQ(cfg.cache.driver, "database");
}

TEST_F(ConfigTest, CacheDriverDefaultsToDatabase) {
    EXPECT_EQ(CacheConfig{}.driver, "database");
    EXPECT_EQ(loadConfig(write("cache: {}\n")).cache.driver, "database");
    EXPECT_EQ(loadConfig(write("cache:\n  driver: memory\n")).cache.driver, "memory");
}

TEST_F(ConfigTest, ReadsNestedSections) {
    const auto cfg = loadConfig(write(R"(
storage:
  images: s3
  s3:
    bucket: wiki-images
    region: eu-west-2
thumbnails:
  cache_ttl_hours: 12
cleanup:
  batch_size: 50
  check_revisions: false
avatar:
  url: "https://avatars.example.com/${hash}?s=${size}"
database:
  port: 6543
  pool_size: 2
logging:
  log_levels:
    console_log_level: debug
    subsystem_levels:
      cleanup: trace
)"));

    EXPECT_EQ(cfg.storage.images, "s3");
    EXPECT_EQ(cfg.storage.s3.bucket, "wiki-images");
    EXPECT_EQ(cfg.storage.s3.region, "eu-west-2");
    EXPECT_EQ(cfg.thumbnails.cache_ttl_hours, 12u);
    EXPECT_EQ(cfg.cleanup.batch_size, 50u);
    EXPECT_FALSE(cfg.cleanup.check_revisions);
    EXPECT_EQ(cfg.avatar.url, "https://avatars.example.com/${hash}?s=${size}");
    EXPECT_EQ(cfg.database.port, 6543);
    EXPECT_EQ(cfg.database.pool_size, 2u);
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.cleanup, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::err);
}

TEST_F(ConfigTest, EnvironmentOverridesSecrets) {
    setenv("IMAGEHALL_DB_PASSWORD", "from-env", 1);
    setenv("IMAGEHALL_S3_SECRET", "s3cr3t", 1);
    const auto cfg = loadConfig(write("database:\n  password: from-file\n"));
    EXPECT_EQ(cfg.database.password, "from-env");
    EXPECT_EQ(cfg.storage.s3.secret_key, "s3cr3t");
}
