#pragma once

#include "storage/Engine.hpp"

namespace ih::storage {

class LocalEngine final : public Engine {
public:
    explicit LocalEngine(fs::path root);

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

    [[nodiscard]] StorageType type() const override { return StorageType::Local; }

    [[nodiscard]] const fs::path& root() const { return root_; }

private:
    fs::path root_;

    [[nodiscard]] fs::path absPath(const fs::path& path) const;
    [[nodiscard]] std::string relative(const fs::path& abs) const;
};

}
