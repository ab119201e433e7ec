#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "config/Config.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <algorithm>
#include <iomanip>
#include <mutex>
#include <regex>
#include <sstream>

namespace ih::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    unsigned char sig[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), rawKey.data(), static_cast<int>(rawKey.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), sig, nullptr);

    std::ostringstream oss;
    for (const unsigned char i : sig) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(i);
    return oss.str();
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p) {
    std::ostringstream out;
    bool first = true;
    for (const auto& part : p.relative_path()) {
        if (!first) out << '/';
        first = false;

        const std::string seg = part.string();
        char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
        if (!esc) throw std::runtime_error("escape failed");
        out << esc;
        curl_free(esc);
    }
    return out.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

void parsePagination(const std::string& response, std::string& continuationToken, bool& moreResults) {
    moreResults = std::regex_search(response, std::regex("<IsTruncated>true</IsTruncated>"));
    std::smatch tokenMatch;
    if (moreResults && std::regex_search(response, tokenMatch,
                                         std::regex("<NextContinuationToken>([^<]+)</NextContinuationToken>")))
        continuationToken = tokenMatch[1].str();
    else moreResults = false;
}

std::string xmlUnescape(const std::string& s) {
    static const std::pair<std::string, std::string> entities[] = {
        {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&apos;", "'"}, {"&amp;", "&"}
    };

    std::string out = s;
    for (const auto& [entity, ch] : entities) {
        size_t pos = 0;
        while ((pos = out.find(entity, pos)) != std::string::npos) {
            out.replace(pos, entity.size(), ch);
            pos += ch.size();
        }
    }
    return out;
}

std::vector<std::string> parseListKeys(const std::string& xml) {
    static const std::regex keyRe("<Contents>[\\s\\S]*?<Key>([^<]+)</Key>[\\s\\S]*?</Contents>");
    std::vector<std::string> keys;
    for (auto it = std::sregex_iterator(xml.begin(), xml.end(), keyRe); it != std::sregex_iterator(); ++it)
        keys.push_back(xmlUnescape((*it)[1].str()));
    return keys;
}

std::vector<std::string> parseCommonPrefixes(const std::string& xml) {
    static const std::regex prefixRe("<CommonPrefixes>\\s*<Prefix>([^<]+)</Prefix>\\s*</CommonPrefixes>");
    std::vector<std::string> prefixes;
    for (auto it = std::sregex_iterator(xml.begin(), xml.end(), prefixRe); it != std::sregex_iterator(); ++it)
        prefixes.push_back(xmlUnescape((*it)[1].str()));
    return prefixes;
}

static std::string canonicalizeQuery(const std::string& query) {
    if (query.empty()) return {};

    std::vector<std::string> params;
    std::istringstream in(query);
    std::string param;
    while (std::getline(in, param, '&')) {
        if (param.empty()) continue;
        if (param.find('=') == std::string::npos) param += "=";
        params.push_back(param);
    }
    std::ranges::sort(params);

    std::string out;
    for (size_t i = 0; i < params.size(); ++i) {
        if (i) out += '&';
        out += params[i];
    }
    return out;
}

std::string buildAuthorizationHeader(const config::S3Config& s3,
                                     const std::string& method,
                                     const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery) {
    std::string canonicalPath = fullPath;
    std::string effectiveQuery = canonicalQuery;

    if (canonicalQuery.empty()) {
        if (const auto qpos = fullPath.find('?'); qpos != std::string::npos) {
            canonicalPath = fullPath.substr(0, qpos);
            effectiveQuery = fullPath.substr(qpos + 1);
        }
    }
    effectiveQuery = canonicalizeQuery(effectiveQuery);

    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD

    // std::map keeps header names sorted, as SigV4 requires
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end()) signedHeaders += ";";
    }

    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << effectiveQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;
    const std::string hashedCanonicalRequest = sha256Hex(canonicalRequestStream.str());

    const std::string credentialScope = dateStamp + "/" + s3.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << credentialScope << "\n"
                       << hashedCanonicalRequest;

    const std::string kDate    = hmacSha256Raw("AWS4" + s3.secret_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, s3.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << s3.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

}
