#include "storage/s3/Controller.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <cstring>
#include <fmt/format.h>

using namespace ih::util;
using namespace ih::log;

namespace ih::storage::s3 {

Controller::Controller(config::S3Config cfg) : cfg_(std::move(cfg)) {
    if (cfg_.bucket.empty()) throw std::invalid_argument("S3 storage requires a bucket");
    endpoint_ = cfg_.endpoint.empty() ? fmt::format("https://s3.{}.amazonaws.com", cfg_.region) : cfg_.endpoint;
    while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
    ensureCurlGlobalInit();
}

std::map<std::string, std::string> Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
        {"host", endpoint_.substr(endpoint_.find("//") + 2)},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", getCurrentTimestamp()}
    };
}

SList Controller::makeSigHeaders(const std::string& method,
                                 const std::string& canonical,
                                 const std::string& payloadHash,
                                 const std::map<std::string, std::string>& extra) const {
    auto base = buildHeaderMap(payloadHash);
    base.insert(extra.begin(), extra.end());
    const auto auth = buildAuthorizationHeader(cfg_, method, canonical, base, payloadHash);

    SList out;
    out.add("Authorization: " + auth);
    for (const auto& [k, v] : base) {
        if (k == "host") continue;  // curl derives it from the URL
        out.add(k + ": " + v);
    }
    return out;
}

std::pair<std::string, std::string> Controller::constructPaths(CURL* curl, const fs::path& p,
                                                               const std::string& query) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, p);
    const auto canonicalPath = "/" + cfg_.bucket + "/" + escapedKey + query;
    const auto url = endpoint_ + canonicalPath;
    return {canonicalPath, url};
}

bool Controller::headObject(const fs::path& key) const {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);
    const SList hdrs = makeSigHeaders("HEAD", canonical, "UNSIGNED-PAYLOAD");

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.ok()) return true;
    if (resp.curl == CURLE_OK && resp.http == 404) return false;

    Registry::cloud()->error("[S3Controller] headObject failed for {}: CURL={} HTTP={}",
                             key.string(), static_cast<int>(resp.curl), resp.http);
    throw std::runtime_error(fmt::format("Failed to stat S3 object {} (HTTP {})", key.string(), resp.http));
}

std::optional<std::vector<uint8_t>> Controller::getObject(const fs::path& key) const {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);
    const SList hdrs = makeSigHeaders("GET", canonical, "UNSIGNED-PAYLOAD");

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.curl == CURLE_OK && resp.http == 404) return std::nullopt;
    if (!resp.ok()) {
        Registry::cloud()->error("[S3Controller] getObject failed for {}: CURL={} HTTP={}",
                                 key.string(), static_cast<int>(resp.curl), resp.http);
        throw std::runtime_error(
            fmt::format("Failed to download S3 object {} (HTTP {}): {}", key.string(), resp.http, resp.body));
    }

    return std::vector<uint8_t>(resp.body.begin(), resp.body.end());
}

void Controller::putObject(const fs::path& key, const std::vector<uint8_t>& buffer,
                           const std::string& contentType) const {
    Registry::cloud()->debug("[S3Controller] Uploading {} bytes to key {}", buffer.size(), key.string());

    const std::string payloadHash = sha256Hex(std::string(buffer.begin(), buffer.end()));

    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);

    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash);
    hdrs.add("Content-Type: " + contentType);
    hdrs.add("Expect:");

    struct ReadCtx {
        const uint8_t* data{nullptr};
        size_t size{0};
        size_t off{0};
    } ctx{buffer.data(), buffer.size(), 0};

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(ctx.size));
        curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* out, const size_t size, const size_t nmemb, void* userdata) -> size_t {
                auto* c = static_cast<ReadCtx*>(userdata);
                const size_t remaining = c->off < c->size ? c->size - c->off : 0;
                const size_t toCopy = std::min(remaining, size * nmemb);
                if (toCopy) {
                    std::memcpy(out, c->data + c->off, toCopy);
                    c->off += toCopy;
                }
                return toCopy;
            });
        curl_easy_setopt(h, CURLOPT_SEEKDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_SEEKFUNCTION,
            +[](void* userdata, const curl_off_t offset, const int origin) -> int {
                auto* c = static_cast<ReadCtx*>(userdata);
                if (origin != SEEK_SET || offset < 0 || static_cast<size_t>(offset) > c->size)
                    return CURL_SEEKFUNC_CANTSEEK;
                c->off = static_cast<size_t>(offset);
                return CURL_SEEKFUNC_OK;
            });
    });

    if (!resp.ok()) throw std::runtime_error(
        fmt::format("Failed to upload object to S3 (HTTP {}): {}", resp.http, resp.body));
}

void Controller::putObjectAcl(const fs::path& key, const std::string& cannedAcl) const {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key, "?acl");

    const std::string payloadHash = sha256Hex("");
    SList hdrs = makeSigHeaders("PUT", canonical, payloadHash, {{"x-amz-acl", cannedAcl}});
    hdrs.add("Content-Length: 0");

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) {
        Registry::cloud()->error("[S3Controller] putObjectAcl failed for {}: CURL={} HTTP={}",
                                 key.string(), static_cast<int>(resp.curl), resp.http);
        throw std::runtime_error(
            fmt::format("Failed to set ACL on S3 object (HTTP {}): {}", resp.http, resp.body));
    }
}

void Controller::deleteObject(const fs::path& key) const {
    const CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, key);

    const std::string payloadHash = sha256Hex("");
    const SList hdrs = makeSigHeaders("DELETE", canonical, payloadHash);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) {
        Registry::cloud()->error("[S3Controller] deleteObject failed: CURL={} HTTP={} Response:\n{}",
                                 static_cast<int>(resp.curl), resp.http, resp.body);
        throw std::runtime_error(
            fmt::format("Failed to delete object from S3 (HTTP {}): {}", resp.http, resp.body));
    }
}

}
