#pragma once

#include <optional>
#include <string>

namespace ih::util {

// Plain decimal digits only; no sign, whitespace or values above UINT_MAX.
std::optional<unsigned int> parseUInt(const std::string& s);

}
