#include "db/query/cache/Entry.hpp"
#include "db/Transactions.hpp"

using namespace ih::db;
using namespace ih::db::query::cache;

std::optional<std::string> Entry::getEntry(const std::string& key, const std::time_t now) {
    return Transactions::exec("Entry::getEntry", [&](pqxx::work& txn) -> std::optional<std::string> {
        const auto res = txn.exec(pqxx::prepped{"get_cache_entry"}, pqxx::params{key, static_cast<int64_t>(now)});
        if (res.empty()) return std::nullopt;
        return res[0]["value"].as<std::string>();
    });
}

void Entry::upsertEntry(const std::string& key, const std::string& value, const std::time_t expiration) {
    Transactions::exec("Entry::upsertEntry", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"upsert_cache_entry"}, pqxx::params{key, value, static_cast<int64_t>(expiration)});
    });
}

void Entry::deleteEntry(const std::string& key) {
    Transactions::exec("Entry::deleteEntry", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_cache_entry"}, pqxx::params{key});
    });
}

void Entry::purgeExpired(const std::time_t now) {
    Transactions::exec("Entry::purgeExpired", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"purge_expired_cache_entries"}, pqxx::params{static_cast<int64_t>(now)});
    });
}
