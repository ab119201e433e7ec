#pragma once

#include "config/Config.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ih::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<AppConfig> {
    static Node encode(const AppConfig& rhs) {
        Node node;
        node["url"] = rhs.url;
        node["secure_images"] = rhs.secure_images;
        return node;
    }

    static bool decode(const Node& node, AppConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.url = node["url"].as<std::string>("http://localhost");
        rhs.secure_images = node["secure_images"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<LocalDiskConfig> {
    static Node encode(const LocalDiskConfig& rhs) {
        Node node;
        node["public_root"] = rhs.public_root.string();
        node["secure_root"] = rhs.secure_root.string();
        return node;
    }

    static bool decode(const Node& node, LocalDiskConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.public_root = node["public_root"].as<std::string>("/var/lib/imagehall/public");
        rhs.secure_root = node["secure_root"].as<std::string>("/var/lib/imagehall/storage");
        return true;
    }
};

template<>
struct convert<S3Config> {
    static Node encode(const S3Config& rhs) {
        Node node;
        node["bucket"] = rhs.bucket;
        node["region"] = rhs.region;
        node["endpoint"] = rhs.endpoint;
        node["access_key"] = rhs.access_key;
        // secret_key is never written back out
        return node;
    }

    static bool decode(const Node& node, S3Config& rhs) {
        if (!node.IsMap()) return false;
        rhs.bucket = node["bucket"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("us-east-1");
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_key = node["secret_key"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["images"] = rhs.images;
        node["url"] = rhs.url;
        node["local"] = rhs.local;
        node["s3"] = rhs.s3;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.images = node["images"].as<std::string>("local");
        rhs.url = node["url"].as<std::string>("");
        if (node["local"]) rhs.local = node["local"].as<LocalDiskConfig>();
        if (node["s3"]) rhs.s3 = node["s3"].as<S3Config>();
        return true;
    }
};

template<>
struct convert<ThumbnailsConfig> {
    static Node encode(const ThumbnailsConfig& rhs) {
        Node node;
        node["cache_ttl_hours"] = rhs.cache_ttl_hours;
        node["default_width"] = rhs.default_width;
        node["default_height"] = rhs.default_height;
        return node;
    }

    static bool decode(const Node& node, ThumbnailsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cache_ttl_hours = node["cache_ttl_hours"].as<unsigned int>(72);
        rhs.default_width = node["default_width"].as<unsigned int>(220);
        rhs.default_height = node["default_height"].as<unsigned int>(220);
        return true;
    }
};

template<>
struct convert<CleanupConfig> {
    static Node encode(const CleanupConfig& rhs) {
        Node node;
        node["batch_size"] = rhs.batch_size;
        node["check_revisions"] = rhs.check_revisions;
        return node;
    }

    static bool decode(const Node& node, CleanupConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.batch_size = node["batch_size"].as<unsigned int>(1000);
        rhs.check_revisions = node["check_revisions"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<AvatarConfig> {
    static Node encode(const AvatarConfig& rhs) {
        Node node;
        node["url"] = rhs.url;
        node["disable_services"] = rhs.disable_services;
        node["size"] = rhs.size;
        return node;
    }

    static bool decode(const Node& node, AvatarConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.url = node["url"].as<std::string>("");
        rhs.disable_services = node["disable_services"].as<bool>(false);
        rhs.size = node["size"].as<unsigned int>(500);
        return true;
    }
};

template<>
struct convert<CacheConfig> {
    static Node encode(const CacheConfig& rhs) {
        Node node;
        node["driver"] = rhs.driver;
        return node;
    }

    static bool decode(const Node& node, CacheConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.driver = node["driver"].as<std::string>("database");
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("imagehall");
        rhs.user = node["user"].as<std::string>("imagehall");
        rhs.password = node["password"].as<std::string>("");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["imagehall"] = to_std_string(spdlog::level::to_string_view(rhs.imagehall));
        node["storage"]   = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"]     = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["thumb"]     = to_std_string(spdlog::level::to_string_view(rhs.thumb));
        node["uploads"]   = to_std_string(spdlog::level::to_string_view(rhs.uploads));
        node["cleanup"]   = to_std_string(spdlog::level::to_string_view(rhs.cleanup));
        node["cache"]     = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["db"]        = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["http"]      = to_std_string(spdlog::level::to_string_view(rhs.http));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.imagehall = spdlog::level::from_str(node["imagehall"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.thumb = spdlog::level::from_str(node["thumb"].as<std::string>("warn"));
        rhs.uploads = spdlog::level::from_str(node["uploads"].as<std::string>("info"));
        rhs.cleanup = spdlog::level::from_str(node["cleanup"].as<std::string>("info"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("err"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/imagehall");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
