#include "util/slug.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace ih::util {

namespace {

// U+00C0 to U+017F (Latin-1 Supplement letters and Latin Extended-A)
constexpr char32_t LATIN_FIRST = 0xC0;
constexpr const char* LATIN_ASCII[] = {
    "A", "A", "A", "A", "A", "A", "AE", "C", "E", "E", "E", "E", "I", "I", "I", "I",
    "D", "N", "O", "O", "O", "O", "O", "", "O", "U", "U", "U", "U", "Y", "TH", "ss",
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "y",
    "A", "a", "A", "a", "A", "a", "C", "c", "C", "c", "C", "c", "C", "c", "D", "d",
    "D", "d", "E", "e", "E", "e", "E", "e", "E", "e", "E", "e", "G", "g", "G", "g",
    "G", "g", "G", "g", "H", "h", "H", "h", "I", "i", "I", "i", "I", "i", "I", "i",
    "I", "i", "IJ", "ij", "J", "j", "K", "k", "k", "L", "l", "L", "l", "L", "l", "L",
    "l", "L", "l", "N", "n", "N", "n", "N", "n", "n", "N", "n", "O", "o", "O", "o",
    "O", "o", "OE", "oe", "R", "r", "R", "r", "R", "r", "S", "s", "S", "s", "S", "s",
    "S", "s", "T", "t", "T", "t", "T", "t", "U", "u", "U", "u", "U", "u", "U", "u",
    "U", "u", "U", "u", "W", "w", "Y", "y", "Y", "Z", "z", "Z", "z", "Z", "z", "s",
};
constexpr char32_t LATIN_END = LATIN_FIRST + std::size(LATIN_ASCII);

bool isContinuation(const unsigned char c) { return (c & 0xC0) == 0x80; }

}

std::string toAscii(const std::string_view input) {
    std::string out;
    out.reserve(input.size());

    for (size_t i = 0; i < input.size();) {
        const auto lead = static_cast<unsigned char>(input[i]);
        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        size_t len = 0;
        char32_t cp = 0;
        if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; }
        else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; }
        else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; }

        // Stray continuation or malformed sequence: drop one byte and resync.
        if (len == 0 || i + len > input.size()) { ++i; continue; }
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            const auto c = static_cast<unsigned char>(input[i + k]);
            if (!isContinuation(c)) { valid = false; break; }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (!valid) { ++i; continue; }

        if (cp >= LATIN_FIRST && cp < LATIN_END) out += LATIN_ASCII[cp - LATIN_FIRST];
        i += len;
    }
    return out;
}

std::string slugify(const std::string_view input) {
    const auto ascii = toAscii(input);
    std::string expanded;
    expanded.reserve(ascii.size());
    for (const char c : ascii) {
        if (c == '@') expanded += "-at-";
        else if (c == '_') expanded += '-';
        else expanded += c;
    }

    std::string out;
    out.reserve(expanded.size());
    bool pendingSeparator = false;
    for (const unsigned char c : expanded) {
        if (std::isalnum(c)) {
            if (pendingSeparator && !out.empty()) out += '-';
            pendingSeparator = false;
            out += static_cast<char>(std::tolower(c));
        } else if (c == '-' || std::isspace(c)) {
            pendingSeparator = true;
        }
    }
    return out;
}

std::string toLower(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

bool startsWithIgnoreCase(const std::string_view s, const std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    return toLower(s.substr(0, prefix.size())) == toLower(prefix);
}

std::string ltrim(const std::string_view s, const std::string_view chars) {
    const auto pos = s.find_first_not_of(chars);
    return pos == std::string_view::npos ? std::string{} : std::string(s.substr(pos));
}

std::string rtrim(const std::string_view s, const std::string_view chars) {
    const auto pos = s.find_last_not_of(chars);
    return pos == std::string_view::npos ? std::string{} : std::string(s.substr(0, pos + 1));
}

std::string trim(const std::string_view s, const std::string_view chars) {
    return rtrim(ltrim(s, chars), chars);
}

}
