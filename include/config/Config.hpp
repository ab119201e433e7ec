#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace ih::config {

struct AppConfig {
    std::string url = "http://localhost";
    bool secure_images = false;
};

struct LocalDiskConfig {
    std::filesystem::path public_root = "/var/lib/imagehall/public";
    std::filesystem::path secure_root = "/var/lib/imagehall/storage";
};

struct S3Config {
    std::string bucket;
    std::string region = "us-east-1";
    std::string endpoint;   // empty = AWS
    std::string access_key;
    std::string secret_key;
};

struct StorageConfig {
    std::string images = "local";   // local | local_secure | s3
    std::string url;                 // public base URL override
    LocalDiskConfig local;
    S3Config s3;
};

struct ThumbnailsConfig {
    unsigned int cache_ttl_hours = 72;
    unsigned int default_width = 220;
    unsigned int default_height = 220;
};

struct CleanupConfig {
    unsigned int batch_size = 1000;
    bool check_revisions = true;
};

struct AvatarConfig {
    std::string url;
    bool disable_services = false;
    unsigned int size = 500;
};

struct CacheConfig {
    std::string driver = "database";  // database | memory (per process, for tests and embedders)
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "imagehall";
    std::string user = "imagehall";
    std::string password;
    unsigned int pool_size = 4;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum imagehall = spdlog::level::info;
    spdlog::level::level_enum storage   = spdlog::level::warn;
    spdlog::level::level_enum cloud     = spdlog::level::warn;
    spdlog::level::level_enum thumb     = spdlog::level::warn;
    spdlog::level::level_enum uploads   = spdlog::level::info;
    spdlog::level::level_enum cleanup   = spdlog::level::info;
    spdlog::level::level_enum cache     = spdlog::level::warn;
    spdlog::level::level_enum db        = spdlog::level::err;
    spdlog::level::level_enum http      = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/imagehall";
    LogLevelsConfig levels;
};

struct Config {
    AppConfig app;
    StorageConfig storage;
    ThumbnailsConfig thumbnails;
    CleanupConfig cleanup;
    AvatarConfig avatar;
    CacheConfig cache;
    DatabaseConfig database;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

}
