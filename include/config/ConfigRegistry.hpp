#pragma once

#include "config/Config.hpp"
#include "config/paths.hpp"

#include <mutex>

namespace ih::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = paths::getConfigPath());

    // Installs an already-built configuration (tests, embedding).
    static void init(Config config);

    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

}
