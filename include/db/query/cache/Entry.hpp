#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace ih::db::query::cache {

class Entry {
public:
    // Unexpired value for key as of now
    [[nodiscard]] static std::optional<std::string> getEntry(const std::string& key, std::time_t now);
    static void upsertEntry(const std::string& key, const std::string& value, std::time_t expiration);
    static void deleteEntry(const std::string& key);
    static void purgeExpired(std::time_t now);
};

}
