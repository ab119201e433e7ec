#include "util/encoding.hpp"
#include "util/s3Helpers.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ih::util {

std::optional<std::vector<uint8_t>> base64Decode(const std::string_view encoded) {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");

    std::vector<uint8_t> out(encoded.size() / 4 * 3 + 3);
    for (const int variant : {sodium_base64_VARIANT_ORIGINAL, sodium_base64_VARIANT_ORIGINAL_NO_PADDING}) {
        size_t len = 0;
        const char* end = nullptr;
        if (sodium_base642bin(out.data(), out.size(), encoded.data(), encoded.size(),
                              " \t\r\n", &len, &end, variant) == 0 && end == encoded.data() + encoded.size()) {
            out.resize(len);
            return out;
        }
    }
    return std::nullopt;
}

std::string base64Encode(const std::vector<uint8_t>& bytes) {
    if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");

    const size_t encodedLen = sodium_base64_encoded_len(bytes.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(encodedLen, '\0');
    sodium_bin2base64(out.data(), out.size(), bytes.data(), bytes.size(), sodium_base64_VARIANT_ORIGINAL);
    out.resize(encodedLen - 1); // drop trailing NUL
    return out;
}

std::string md5Hex(const std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digestLen, EVP_md5(), nullptr) != 1)
        throw std::runtime_error("MD5 digest failed");

    std::ostringstream oss;
    for (unsigned int i = 0; i < digestLen; ++i)
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return oss.str();
}

std::string urlEncode(const std::string_view s) {
    ensureCurlGlobalInit();
    char* esc = curl_easy_escape(nullptr, s.data(), static_cast<int>(s.size()));
    if (!esc) throw std::runtime_error("URL escape failed");
    std::string out(esc);
    curl_free(esc);
    return out;
}

}
