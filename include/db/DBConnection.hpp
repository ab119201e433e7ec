#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace ih::config { struct DatabaseConfig; }

namespace ih::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedImages() const;
    void initPreparedCache() const;
    void initPreparedContent() const;
};

}
