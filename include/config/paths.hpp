#pragma once

#include <filesystem>

namespace ih::paths {

inline constexpr auto DEFAULT_CONFIG_PATH = "/etc/imagehall/config.yaml";

// $IMAGEHALL_CONFIG if set, DEFAULT_CONFIG_PATH otherwise.
std::filesystem::path getConfigPath();

}
