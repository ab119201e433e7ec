#include "cache/DatabaseStore.hpp"
#include "db/query/cache/Entry.hpp"
#include "log/Registry.hpp"

using namespace ih::db::query::cache;
using namespace std::chrono;

namespace ih::cache {

static std::time_t now() { return system_clock::to_time_t(system_clock::now()); }

std::optional<std::string> DatabaseStore::get(const std::string& key) {
    return Entry::getEntry(key, now());
}

void DatabaseStore::put(const std::string& key, const std::string& value, const seconds ttl) {
    Entry::upsertEntry(key, value, now() + ttl.count());
}

void DatabaseStore::forget(const std::string& key) {
    Entry::deleteEntry(key);
}

void DatabaseStore::purgeExpired() {
    Entry::purgeExpired(now());
    log::Registry::cache()->debug("[DatabaseStore] Purged expired cache entries");
}

}
