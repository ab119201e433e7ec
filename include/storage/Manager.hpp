#pragma once

#include "uploads/model/Type.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace ih::config { struct StorageConfig; }

namespace ih::storage {

class Engine;

/**
 * Owns the named storage disks ("local", "local_secure", "s3") and decides which one an
 * image type lives on. The override table is the only place a type is moved off the default disk.
 */
class Manager {
public:
    struct Override {
        uploads::model::Type type;
        std::string from, to;
    };

    Manager(std::string defaultDisk, std::unordered_map<std::string, std::shared_ptr<Engine>> disks);

    static std::shared_ptr<Manager> fromConfig(const config::StorageConfig& cfg);

    [[nodiscard]] std::shared_ptr<Engine> disk(const std::string& name) const;

    [[nodiscard]] std::string diskNameFor(const uploads::model::Type& type) const;

    [[nodiscard]] std::shared_ptr<Engine> forType(const uploads::model::Type& type) const;

    [[nodiscard]] const std::string& defaultDisk() const { return defaultDisk_; }

    [[nodiscard]] static const std::vector<Override>& overrides();

private:
    std::string defaultDisk_;
    std::unordered_map<std::string, std::shared_ptr<Engine>> disks_;
};

}
