#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ih::util {

[[nodiscard]] std::optional<std::vector<uint8_t>> base64Decode(std::string_view encoded);
[[nodiscard]] std::string base64Encode(const std::vector<uint8_t>& bytes);

[[nodiscard]] std::string md5Hex(std::string_view data);

// RFC 3986 percent-encoding via libcurl.
[[nodiscard]] std::string urlEncode(std::string_view s);

}
