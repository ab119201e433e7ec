#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ih::http {

// Network failure or non-2xx response.
struct FetchError : std::runtime_error {
    long status;
    FetchError(const std::string& msg, const long status = 0) : std::runtime_error(msg), status(status) {}
};

using Fetcher = std::function<std::vector<uint8_t>(const std::string& url)>;

[[nodiscard]] std::vector<uint8_t> fetch(const std::string& url, std::chrono::seconds timeout = std::chrono::seconds(15));

}
