#include "config/paths.hpp"

#include <cstdlib>

namespace ih::paths {

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("IMAGEHALL_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

}
