#pragma once

#include "cache/Store.hpp"

namespace ih::cache {

// Backed by the shared `cache` table, so entries survive restarts and are seen by every process.
class DatabaseStore final : public Store {
public:
    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& value, std::chrono::seconds ttl) override;
    void forget(const std::string& key) override;

    void purgeExpired();
};

}
