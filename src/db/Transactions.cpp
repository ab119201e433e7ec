#include "db/Transactions.hpp"
#include "db/schema.hpp"

#include <algorithm>

namespace ih::db {

void Transactions::init(const config::DatabaseConfig& cfg) {
    {
        const DBConnection bootstrap(cfg);
        schema::ensure(bootstrap.get());
    }

    auto pool = std::make_shared<DBPool>(cfg);
    for (size_t i = 0; i < std::max<size_t>(cfg.pool_size, 1); ++i) {
        auto conn = pool->acquire();
        conn->initPrepared();
        pool->release(std::move(conn));
    }
    dbPool_ = std::move(pool);

    log::Registry::db()->info("[Transactions] Pool ready with {} connections", std::max<size_t>(cfg.pool_size, 1));
}

}
