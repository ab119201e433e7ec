#pragma once

#include <string>

namespace ih::util {

// Uniformly random [0-9A-Za-z] string from the libsodium CSPRNG.
std::string randomAlnum(size_t length);

}
