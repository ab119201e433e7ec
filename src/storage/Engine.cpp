#include "storage/Engine.hpp"

namespace ih::storage {

void Engine::remove(const std::vector<std::string>& paths) {
    for (const auto& p : paths) remove(fs::path(p));
}

fs::path Engine::normalize(const fs::path& path) {
    const auto rel = path.relative_path().lexically_normal();
    for (const auto& part : rel)
        if (part == "..") throw std::invalid_argument("Path escapes storage root: " + path.generic_string());
    if (rel == ".") return {};
    return rel;
}

}
