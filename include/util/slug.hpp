#pragma once

#include <string>
#include <string_view>

namespace ih::util {

// Transliterates Latin letters of a UTF-8 string to ASCII ("é" -> "e", "ß" -> "ss").
// Other non-ASCII characters and malformed sequences are dropped.
std::string toAscii(std::string_view input);

/**
 * URL- and filesystem-safe slug: transliterated to ASCII, lower case, '_' and whitespace
 * become '-', '@' becomes "-at-", other punctuation (dots included) is dropped, separator
 * runs are collapsed and trimmed from both ends.
 */
std::string slugify(std::string_view input);

std::string toLower(std::string_view s);

bool startsWithIgnoreCase(std::string_view s, std::string_view prefix);

std::string trim(std::string_view s, std::string_view chars = " \t\r\n");
std::string ltrim(std::string_view s, std::string_view chars);
std::string rtrim(std::string_view s, std::string_view chars);

}
