#include "storage/CloudEngine.hpp"
#include "storage/s3/Controller.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace ih::log;

namespace ih::storage {

CloudEngine::CloudEngine(std::shared_ptr<s3::Controller> controller) : controller_(std::move(controller)) {
    if (!controller_) throw std::invalid_argument("CloudEngine requires an S3 controller");
}

std::string CloudEngine::dirPrefix(const fs::path& dir) {
    auto prefix = normalize(dir).generic_string();
    if (!prefix.empty() && prefix.back() != '/') prefix += '/';
    return prefix;
}

bool CloudEngine::exists(const fs::path& path) const {
    return controller_->headObject(normalize(path));
}

std::vector<uint8_t> CloudEngine::get(const fs::path& path) const {
    auto bytes = controller_->getObject(normalize(path));
    if (!bytes) throw NotFound(path);
    return std::move(*bytes);
}

void CloudEngine::put(const fs::path& path, const std::vector<uint8_t>& bytes) {
    controller_->putObject(normalize(path), bytes);
}

void CloudEngine::setPublic(const fs::path& path) {
    controller_->putObjectAcl(normalize(path), "public-read");
}

void CloudEngine::remove(const fs::path& path) {
    controller_->deleteObject(normalize(path));
}

std::vector<std::string> CloudEngine::files(const fs::path& dir) const {
    const auto prefix = dirPrefix(dir);
    auto keys = controller_->list(prefix, "/").keys;
    // directory placeholder objects
    std::erase_if(keys, [](const std::string& k) { return k.empty() || k.back() == '/'; });
    return keys;
}

std::vector<std::string> CloudEngine::directories(const fs::path& dir) const {
    std::vector<std::string> out;
    for (auto& p : controller_->list(dirPrefix(dir), "/").prefixes) {
        if (!p.empty() && p.back() == '/') p.pop_back();
        out.push_back(std::move(p));
    }
    return out;
}

std::vector<std::string> CloudEngine::allFiles(const fs::path& dir) const {
    auto keys = controller_->list(dirPrefix(dir)).keys;
    std::erase_if(keys, [](const std::string& k) { return k.empty() || k.back() == '/'; });
    return keys;
}

void CloudEngine::deleteDirectory(const fs::path& dir) {
    const auto prefix = dirPrefix(dir);
    if (prefix.empty()) throw std::invalid_argument("Refusing to delete the bucket root");

    // Object stores have no real directories; remove everything under the prefix plus any marker.
    for (const auto& key : controller_->list(prefix).keys) controller_->deleteObject(key);
    Registry::cloud()->debug("[CloudEngine] Deleted directory prefix {}", prefix);
}

}
