#pragma once

#include "storage/Engine.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace ih::test {

namespace fs = std::filesystem;

// Forwards to a real engine and counts calls; can be told to fail writes or removals.
class CountingEngine final : public storage::Engine {
public:
    explicit CountingEngine(std::shared_ptr<storage::Engine> inner) : inner_(std::move(inner)) {}

    using Engine::remove;

    mutable unsigned int existsCalls = 0, getCalls = 0;
    unsigned int putCalls = 0, setPublicCalls = 0, removeCalls = 0;
    bool failWrites = false, failRemoves = false;

    [[nodiscard]] bool exists(const fs::path& path) const override {
        ++existsCalls;
        return inner_->exists(path);
    }

    [[nodiscard]] std::vector<uint8_t> get(const fs::path& path) const override {
        ++getCalls;
        return inner_->get(path);
    }

    void put(const fs::path& path, const std::vector<uint8_t>& bytes) override {
        ++putCalls;
        if (failWrites) throw std::runtime_error("disk full");
        inner_->put(path, bytes);
    }

    void setPublic(const fs::path& path) override {
        ++setPublicCalls;
        inner_->setPublic(path);
    }

    void remove(const fs::path& path) override {
        ++removeCalls;
        if (failRemoves) throw std::runtime_error("permission denied");
        inner_->remove(path);
    }

    [[nodiscard]] std::vector<std::string> files(const fs::path& dir) const override { return inner_->files(dir); }
    [[nodiscard]] std::vector<std::string> directories(const fs::path& dir) const override { return inner_->directories(dir); }
    [[nodiscard]] std::vector<std::string> allFiles(const fs::path& dir) const override { return inner_->allFiles(dir); }

    void deleteDirectory(const fs::path& dir) override { inner_->deleteDirectory(dir); }

    [[nodiscard]] storage::StorageType type() const override { return inner_->type(); }

private:
    std::shared_ptr<storage::Engine> inner_;
};

}
