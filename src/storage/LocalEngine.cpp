#include "storage/LocalEngine.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

using namespace ih::util;

namespace ih::storage {

LocalEngine::LocalEngine(fs::path root) : root_(std::move(root)) {
    if (root_.empty()) throw std::invalid_argument("LocalEngine requires a root directory");
}

fs::path LocalEngine::absPath(const fs::path& path) const {
    return root_ / normalize(path);
}

std::string LocalEngine::relative(const fs::path& abs) const {
    return abs.lexically_relative(root_).generic_string();
}

bool LocalEngine::exists(const fs::path& path) const {
    return fs::exists(absPath(path));
}

std::vector<uint8_t> LocalEngine::get(const fs::path& path) const {
    const auto abs = absPath(path);
    if (!fs::is_regular_file(abs)) throw NotFound(path);
    return readFileToVector(abs);
}

void LocalEngine::put(const fs::path& path, const std::vector<uint8_t>& bytes) {
    const auto abs = absPath(path);
    fs::create_directories(abs.parent_path());
    writeFileAtomic(abs, bytes);
    log::Registry::storage()->debug("[LocalEngine] Wrote {} bytes to {}", bytes.size(), abs.string());
}

void LocalEngine::setPublic(const fs::path& path) {
    const auto abs = absPath(path);
    if (!fs::exists(abs)) throw NotFound(path);
    fs::permissions(abs,
                    fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);
}

void LocalEngine::remove(const fs::path& path) {
    const auto abs = absPath(path);
    std::error_code ec;
    if (!fs::remove(abs, ec) && ec) throw fs::filesystem_error("Failed to remove file", abs, ec);
}

std::vector<std::string> LocalEngine::files(const fs::path& dir) const {
    std::vector<std::string> out;
    const auto abs = absPath(dir);
    if (!fs::is_directory(abs)) return out;
    for (const auto& entry : fs::directory_iterator(abs))
        if (entry.is_regular_file()) out.push_back(relative(entry.path()));
    return out;
}

std::vector<std::string> LocalEngine::directories(const fs::path& dir) const {
    std::vector<std::string> out;
    const auto abs = absPath(dir);
    if (!fs::is_directory(abs)) return out;
    for (const auto& entry : fs::directory_iterator(abs))
        if (entry.is_directory()) out.push_back(relative(entry.path()));
    return out;
}

std::vector<std::string> LocalEngine::allFiles(const fs::path& dir) const {
    std::vector<std::string> out;
    const auto abs = absPath(dir);
    if (!fs::is_directory(abs)) return out;
    for (const auto& entry : fs::recursive_directory_iterator(abs, fs::directory_options::skip_permission_denied))
        if (entry.is_regular_file()) out.push_back(relative(entry.path()));
    return out;
}

void LocalEngine::deleteDirectory(const fs::path& dir) {
    const auto abs = absPath(dir);
    if (normalize(dir).empty()) throw std::invalid_argument("Refusing to delete the storage root");
    fs::remove_all(abs);
}

}
