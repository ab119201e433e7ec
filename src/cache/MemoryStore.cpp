#include "cache/MemoryStore.hpp"

namespace ih::cache {

std::optional<std::string> MemoryStore::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (it->second.expires <= Clock::now()) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void MemoryStore::put(const std::string& key, const std::string& value, const std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    if (ttl.count() <= 0) {
        entries_.erase(key);
        return;
    }
    entries_[key] = {value, Clock::now() + ttl};
}

void MemoryStore::forget(const std::string& key) {
    std::lock_guard lock(mutex_);
    entries_.erase(key);
}

size_t MemoryStore::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}
