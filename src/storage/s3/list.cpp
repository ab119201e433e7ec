#include "storage/s3/Controller.hpp"
#include "util/s3Helpers.hpp"
#include "util/encoding.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <sstream>

using namespace ih::util;
using namespace ih::log;

namespace ih::storage::s3 {

ListResult Controller::list(const std::string& prefix, const std::string& delimiter) const {
    ListResult result;
    std::string continuationToken;
    bool moreResults = true;

    while (moreResults) {
        // Query parameters are already in canonical (sorted) order.
        std::ostringstream query;
        if (!continuationToken.empty()) query << "continuation-token=" << urlEncode(continuationToken) << "&";
        if (!delimiter.empty()) query << "delimiter=" << urlEncode(delimiter) << "&";
        query << "list-type=2";
        if (!prefix.empty()) query << "&prefix=" << urlEncode(prefix);

        const std::string canonical = "/" + cfg_.bucket + "/";
        const std::string url = endpoint_ + canonical + "?" + query.str();

        const std::string payloadHash = "UNSIGNED-PAYLOAD";
        const auto hdrMap = buildHeaderMap(payloadHash);
        const std::string authHeader = buildAuthorizationHeader(cfg_, "GET", canonical, hdrMap, payloadHash, query.str());

        SList headers;
        headers.add("Authorization: " + authHeader);
        for (const auto& [k, v] : hdrMap)
            if (k != "host") headers.add(k + ": " + v);

        const HttpResponse resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        });

        if (!resp.ok()) {
            Registry::cloud()->error("[S3Controller] listObjects failed: CURL={} HTTP={} Response:\n{}",
                                     static_cast<int>(resp.curl), resp.http, resp.body);
            throw std::runtime_error(fmt::format("Failed to list S3 objects under '{}' (HTTP {})", prefix, resp.http));
        }

        for (auto& key : parseListKeys(resp.body)) result.keys.push_back(std::move(key));
        for (auto& p : parseCommonPrefixes(resp.body)) result.prefixes.push_back(std::move(p));

        continuationToken.clear();
        parsePagination(resp.body, continuationToken, moreResults);
    }

    return result;
}

}
