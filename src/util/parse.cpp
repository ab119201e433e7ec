#include "util/parse.hpp"

#include <limits>

std::optional<unsigned int> ih::util::parseUInt(const std::string& s) {
    if (s.empty()) return std::nullopt;

    unsigned long long v = 0;
    for (const char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }

    return static_cast<unsigned int>(v);
}
