#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>

namespace ih::config {

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["app"]) YAML::convert<AppConfig>::decode(node, cfg.app);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["thumbnails"]) YAML::convert<ThumbnailsConfig>::decode(node, cfg.thumbnails);
    if (auto node = root["cleanup"]) YAML::convert<CleanupConfig>::decode(node, cfg.cleanup);
    if (auto node = root["avatar"]) YAML::convert<AvatarConfig>::decode(node, cfg.avatar);
    if (auto node = root["cache"]) YAML::convert<CacheConfig>::decode(node, cfg.cache);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (const char* pass = std::getenv("IMAGEHALL_DB_PASSWORD"); pass && *pass) cfg.database.password = pass;
    if (const char* secret = std::getenv("IMAGEHALL_S3_SECRET"); secret && *secret) cfg.storage.s3.secret_key = secret;

    return cfg;
}

}
