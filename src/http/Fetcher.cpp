#include "http/Fetcher.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace ih::util;

namespace ih::http {

std::vector<uint8_t> fetch(const std::string& url, const std::chrono::seconds timeout) {
    ensureCurlGlobalInit();

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(h, CURLOPT_PROTOCOLS_STR, "http,https");
        curl_easy_setopt(h, CURLOPT_USERAGENT, "imagehall/fetch");
    });

    if (resp.curl != CURLE_OK) {
        log::Registry::http()->warn("[Fetcher] {} failed: {}", url, curl_easy_strerror(resp.curl));
        throw FetchError(fmt::format("Request to {} failed: {}", url, curl_easy_strerror(resp.curl)));
    }

    if (!resp.ok()) {
        log::Registry::http()->warn("[Fetcher] {} returned HTTP {}", url, resp.http);
        throw FetchError(fmt::format("Request to {} returned HTTP {}", url, resp.http), resp.http);
    }

    log::Registry::http()->debug("[Fetcher] Fetched {} bytes from {}", resp.body.size(), url);
    return {resp.body.begin(), resp.body.end()};
}

}
