#include <gtest/gtest.h>
#include "uploads/UrlResolver.hpp"

using namespace ih;
using namespace ih::uploads;

namespace {

config::AppConfig app(const std::string& url = "https://wiki.example.com") {
    config::AppConfig a;
    a.url = url;
    return a;
}

config::StorageConfig s3Storage(const std::string& bucket, const std::string& endpoint = "") {
    config::StorageConfig s;
    s.images = "s3";
    s.s3.bucket = bucket;
    s.s3.region = "eu-west-2";
    s.s3.endpoint = endpoint;
    return s;
}

}

TEST(UrlResolverTest, LocalDiskUsesAppUrl) {
    const UrlResolver r(app("https://wiki.example.com/"), {});
    EXPECT_EQ(r.publicBase(), "https://wiki.example.com");
    EXPECT_EQ(r.toPublicUrl("/uploads/images/gallery/2024-05/cat.png"),
              "https://wiki.example.com/uploads/images/gallery/2024-05/cat.png");
}

TEST(UrlResolverTest, ExplicitStorageUrlWins) {
    config::StorageConfig s = s3Storage("images");
    s.url = "https://cdn.example.com/";
    const UrlResolver r(app(), s);
    EXPECT_EQ(r.toPublicUrl("uploads/images/a.png"), "https://cdn.example.com/uploads/images/a.png");
}

TEST(UrlResolverTest, S3VirtualHostedBucket) {
    const UrlResolver r(app(), s3Storage("wiki-images"));
    EXPECT_EQ(r.publicBase(), "https://wiki-images.s3.amazonaws.com");
}

TEST(UrlResolverTest, S3DottedBucketUsesPathStyle) {
    const UrlResolver r(app(), s3Storage("images.example.com"));
    EXPECT_EQ(r.publicBase(), "https://s3-eu-west-2.amazonaws.com/images.example.com");
}

TEST(UrlResolverTest, CustomEndpointVirtualHosted) {
    const UrlResolver r(app(), s3Storage("wiki", "http://minio.local:9000/"));
    EXPECT_EQ(r.publicBase(), "http://wiki.minio.local:9000");
}

TEST(UrlResolverTest, CustomEndpointDottedBucket) {
    const UrlResolver r(app(), s3Storage("wiki.images", "https://minio.local"));
    EXPECT_EQ(r.publicBase(), "https://minio.local/wiki.images");
}

TEST(UrlResolverTest, RelativeUploadPathIsAccepted) {
    const UrlResolver r(app(), {});
    EXPECT_EQ(r.toStoragePath("/uploads/images/gallery/2024-05/cat.png"), "uploads/images/gallery/2024-05/cat.png");
    EXPECT_EQ(r.toStoragePath("  Uploads/Images/x.png  "), "Uploads/Images/x.png");
}

TEST(UrlResolverTest, AppUrlIsAccepted) {
    const UrlResolver r(app(), {});
    EXPECT_EQ(r.toStoragePath("https://wiki.example.com/uploads/images/gallery/2024-05/cat.png"),
              "uploads/images/gallery/2024-05/cat.png");
}

TEST(UrlResolverTest, StorageUrlIsAccepted) {
    const UrlResolver r(app(), s3Storage("wiki-images"));
    EXPECT_EQ(r.toStoragePath("https://wiki-images.s3.amazonaws.com/uploads/images/cover/2024-05/c.jpg"),
              "uploads/images/cover/2024-05/c.jpg");
}

TEST(UrlResolverTest, ForeignUrlsAreRejected) {
    const UrlResolver r(app(), {});
    EXPECT_FALSE(r.toStoragePath("https://evil.example.org/uploads/images/cat.png"));
    EXPECT_FALSE(r.toStoragePath("https://wiki.example.com/attachments/1"));
    EXPECT_FALSE(r.toStoragePath("/etc/passwd"));
    EXPECT_FALSE(r.toStoragePath(""));
}

TEST(UrlResolverTest, TraversalIsRejected) {
    const UrlResolver r(app(), {});
    EXPECT_FALSE(r.toStoragePath("/uploads/images/../../etc/passwd"));
    EXPECT_FALSE(r.toStoragePath("https://wiki.example.com/uploads/images/gallery/../../../secret"));
}
