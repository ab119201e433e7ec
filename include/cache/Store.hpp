#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ih::cache {

// Key/value store with expiry.
class Store {
public:
    virtual ~Store() = default;

    [[nodiscard]] virtual bool has(const std::string& key) { return get(key).has_value(); }
    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const std::string& value, std::chrono::seconds ttl) = 0;
    virtual void forget(const std::string& key) = 0;
};

}
