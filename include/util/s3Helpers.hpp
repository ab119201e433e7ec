#pragma once

#include <map>
#include <string>
#include <vector>
#include <filesystem>
#include <curl/curl.h>

namespace ih::config {
struct S3Config;
}

namespace ih::util {

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);
std::string escapeKeyPreserveSlashes(CURL* curl, const std::filesystem::path& p);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);
void parsePagination(const std::string& response, std::string& continuationToken, bool& moreResults);

// ListObjectsV2 response bodies
std::vector<std::string> parseListKeys(const std::string& xml);
std::vector<std::string> parseCommonPrefixes(const std::string& xml);
std::string xmlUnescape(const std::string& s);

std::string buildAuthorizationHeader(const config::S3Config& s3,
                                     const std::string& method, const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

void ensureCurlGlobalInit();

}
