#include "db/DBConnection.hpp"
#include "db/schema.hpp"
#include "config/Config.hpp"
#include "util/encoding.hpp"
#include "log/Registry.hpp"

namespace ih::db {

DBConnection::DBConnection(const config::DatabaseConfig& cfg) {
    const auto connStr = "postgresql://" + util::urlEncode(cfg.user) + ":" + util::urlEncode(cfg.password) + "@"
                         + cfg.host + ":" + std::to_string(cfg.port) + "/" + cfg.name;
    conn_ = std::make_unique<pqxx::connection>(connStr);
    log::Registry::db()->debug("[DBConnection] Connected to {}:{}/{}", cfg.host, cfg.port, cfg.name);
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::initPrepared() const {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    initPreparedImages();
    initPreparedCache();
    initPreparedContent();
}

}
