#include "db/DBConnection.hpp"

void ih::db::DBConnection::initPreparedCache() const {
    conn_->prepare("get_cache_entry", "SELECT value FROM cache WHERE key = $1 AND expiration > $2");

    conn_->prepare("upsert_cache_entry",
                   "INSERT INTO cache (key, value, expiration) VALUES ($1, $2, $3) "
                   "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value, expiration = EXCLUDED.expiration");

    conn_->prepare("delete_cache_entry", "DELETE FROM cache WHERE key = $1");

    conn_->prepare("purge_expired_cache_entries", "DELETE FROM cache WHERE expiration <= $1");
}
