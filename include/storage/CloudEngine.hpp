#pragma once

#include "storage/Engine.hpp"

#include <memory>

namespace ih::storage {

namespace s3 { class Controller; }

class CloudEngine final : public Engine {
public:
    explicit CloudEngine(std::shared_ptr<s3::Controller> controller);

    using Engine::remove;

    [[nodiscard]] bool exists(const fs::path& path) const override;
    [[nodiscard]] std::vector<uint8_t> get(const fs::path& path) const override;
    void put(const fs::path& path, const std::vector<uint8_t>& bytes) override;
    void setPublic(const fs::path& path) override;
    void remove(const fs::path& path) override;

    [[nodiscard]] std::vector<std::string> files(const fs::path& dir) const override;
    [[nodiscard]] std::vector<std::string> directories(const fs::path& dir) const override;
    [[nodiscard]] std::vector<std::string> allFiles(const fs::path& dir) const override;

    void deleteDirectory(const fs::path& dir) override;

    [[nodiscard]] StorageType type() const override { return StorageType::Cloud; }

private:
    std::shared_ptr<s3::Controller> controller_;

    // "a/b" -> "a/b/", root -> ""
    [[nodiscard]] static std::string dirPrefix(const fs::path& dir);
};

}
