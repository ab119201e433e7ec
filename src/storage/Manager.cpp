#include "storage/Manager.hpp"
#include "storage/LocalEngine.hpp"
#include "storage/CloudEngine.hpp"
#include "storage/s3/Controller.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

using namespace ih::uploads::model;
using namespace ih::log;

namespace ih::storage {

Manager::Manager(std::string defaultDisk, std::unordered_map<std::string, std::shared_ptr<Engine>> disks)
    : defaultDisk_(std::move(defaultDisk)), disks_(std::move(disks)) {
    if (!disks_.contains(defaultDisk_))
        throw std::invalid_argument("Default storage disk is not configured: " + defaultDisk_);
}

std::shared_ptr<Manager> Manager::fromConfig(const config::StorageConfig& cfg) {
    std::unordered_map<std::string, std::shared_ptr<Engine>> disks;
    disks["local"] = std::make_shared<LocalEngine>(cfg.local.public_root);
    disks["local_secure"] = std::make_shared<LocalEngine>(cfg.local.secure_root);

    if (!cfg.s3.bucket.empty())
        disks["s3"] = std::make_shared<CloudEngine>(std::make_shared<s3::Controller>(cfg.s3));
    else if (cfg.images == "s3")
        throw std::invalid_argument("storage.images is 's3' but storage.s3.bucket is not set");

    Registry::storage()->info("[StorageManager] Images stored on '{}' ({} disks configured)",
                              cfg.images, disks.size());

    return std::make_shared<Manager>(cfg.images, std::move(disks));
}

const std::vector<Manager::Override>& Manager::overrides() {
    // System images (logos, icons) must stay publicly reachable.
    static const std::vector<Override> table{
        {Type::System, "local_secure", "local"}
    };
    return table;
}

std::shared_ptr<Engine> Manager::disk(const std::string& name) const {
    const auto it = disks_.find(name);
    if (it == disks_.end()) throw std::invalid_argument("Unknown storage disk: " + name);
    return it->second;
}

std::string Manager::diskNameFor(const Type& type) const {
    for (const auto& o : overrides())
        if (o.type == type && o.from == defaultDisk_) return o.to;
    return defaultDisk_;
}

std::shared_ptr<Engine> Manager::forType(const Type& type) const {
    return disk(diskNameFor(type));
}

}
