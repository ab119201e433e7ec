#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace ih::storage {

namespace fs = std::filesystem;

enum class StorageType { Local, Cloud };

struct NotFound : std::runtime_error {
    explicit NotFound(const fs::path& path) : std::runtime_error("File not found at path: " + path.generic_string()) {}
};

/**
 * Byte-oriented gateway onto one storage disk. Paths are logical and relative to the disk
 * root; a leading '/' is ignored. Listings return relative generic paths without a leading '/'.
 */
class Engine {
public:
    virtual ~Engine() = default;

    [[nodiscard]] virtual bool exists(const fs::path& path) const = 0;

    // Throws NotFound when nothing is stored at path.
    [[nodiscard]] virtual std::vector<uint8_t> get(const fs::path& path) const = 0;

    // Whole-object write, replacing any existing object.
    virtual void put(const fs::path& path, const std::vector<uint8_t>& bytes) = 0;

    virtual void setPublic(const fs::path& path) = 0;

    virtual void remove(const fs::path& path) = 0;
    virtual void remove(const std::vector<std::string>& paths);

    [[nodiscard]] virtual std::vector<std::string> files(const fs::path& dir) const = 0;
    [[nodiscard]] virtual std::vector<std::string> directories(const fs::path& dir) const = 0;
    [[nodiscard]] virtual std::vector<std::string> allFiles(const fs::path& dir) const = 0;

    virtual void deleteDirectory(const fs::path& dir) = 0;

    [[nodiscard]] virtual StorageType type() const = 0;

    // Strips the leading '/', rejects "..", and returns the lexically normal relative form.
    static fs::path normalize(const fs::path& path);
};

}
