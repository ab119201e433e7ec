#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ih::config::Config cfg;
        cfg.logging.log_dir = fs::temp_directory_path() / "imagehall-tests" / "log";
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        cfg.logging.levels.file_log_level = spdlog::level::debug;

        ih::config::ConfigRegistry::init(std::move(cfg));
        ih::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize imagehall test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
