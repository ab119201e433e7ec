#pragma once

#include "cache/Store.hpp"

#include <mutex>
#include <unordered_map>

namespace ih::cache {

class MemoryStore final : public Store {
public:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    void forget(const std::string& key) override;

    [[nodiscard]] size_t size() const;

private:
    struct Entry {
        std::string value;
        Clock::time_point expires;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}
