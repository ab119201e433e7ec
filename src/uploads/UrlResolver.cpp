#include "uploads/UrlResolver.hpp"
#include "util/slug.hpp"

#include <fmt/format.h>

using namespace ih::util;

namespace ih::uploads {

static constexpr std::string_view UPLOADS_PREFIX = "uploads/images";

UrlResolver::UrlResolver(config::AppConfig app, config::StorageConfig storage)
    : app_(std::move(app)), storage_(std::move(storage)) {}

std::string UrlResolver::computePublicBase() const {
    if (!trim(storage_.url).empty()) return rtrim(trim(storage_.url), "/");

    if (storage_.images == "s3") {
        const auto& s3 = storage_.s3;
        const bool dotted = s3.bucket.find('.') != std::string::npos;

        if (s3.endpoint.empty()) {
            // Dots in the bucket break TLS hostname matching for virtual-hosted URLs.
            if (dotted) return fmt::format("https://s3-{}.amazonaws.com/{}", s3.region, s3.bucket);
            return fmt::format("https://{}.s3.amazonaws.com", s3.bucket);
        }

        const auto endpoint = rtrim(s3.endpoint, "/");
        if (dotted) return endpoint + "/" + s3.bucket;

        const auto schemeEnd = endpoint.find("://");
        const auto scheme = schemeEnd == std::string::npos ? std::string("https") : endpoint.substr(0, schemeEnd);
        const auto host = schemeEnd == std::string::npos ? endpoint : endpoint.substr(schemeEnd + 3);
        return fmt::format("{}://{}.{}", scheme, s3.bucket, host);
    }

    return rtrim(app_.url, "/");
}

const std::string& UrlResolver::publicBase() const {
    std::call_once(baseOnce_, [this] { base_ = computePublicBase(); });
    return base_;
}

std::string UrlResolver::toPublicUrl(const std::string& path) const {
    return publicBase() + "/" + ltrim(path, "/");
}

std::optional<std::string> UrlResolver::toStoragePath(const std::string& url) const {
    const auto cleaned = ltrim(trim(url), "/");
    if (cleaned.empty()) return std::nullopt;

    std::optional<std::string> result;

    if (!startsWithIgnoreCase(cleaned, "http")) {
        if (startsWithIgnoreCase(cleaned, UPLOADS_PREFIX)) result = rtrim(cleaned, "/");
    } else {
        const std::string candidates[] = {
            rtrim(app_.url, "/") + "/" + std::string(UPLOADS_PREFIX) + "/",
            toPublicUrl(std::string(UPLOADS_PREFIX) + "/")
        };
        for (const auto& prefix : candidates) {
            if (startsWithIgnoreCase(cleaned, prefix)) {
                result = std::string(UPLOADS_PREFIX) + "/" + trim(cleaned.substr(prefix.size()), "/");
                break;
            }
        }
    }

    if (!result) return std::nullopt;

    // no walking out of the uploads tree
    size_t start = 0;
    while (start <= result->size()) {
        const auto end = result->find('/', start);
        const auto segment = result->substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (segment == "..") return std::nullopt;
        if (end == std::string::npos) break;
        start = end + 1;
    }

    return result;
}

}
