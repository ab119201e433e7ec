#include "db/schema.hpp"
#include "log/Registry.hpp"

#include <pqxx/pqxx>

void ih::db::schema::ensure(pqxx::connection& conn) {
    pqxx::work txn(conn);

    txn.exec(R"SQL(
    CREATE TABLE IF NOT EXISTS images (
        id          SERIAL PRIMARY KEY,
        name        TEXT NOT NULL,
        url         TEXT NOT NULL,
        path        TEXT NOT NULL,
        type        VARCHAR(32) NOT NULL,
        uploaded_to INTEGER NOT NULL DEFAULT 0,
        created_by  INTEGER,
        updated_by  INTEGER,
        created_at  TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP,
        updated_at  TIMESTAMP NOT NULL DEFAULT CURRENT_TIMESTAMP
    )
    )SQL");

    txn.exec("CREATE INDEX IF NOT EXISTS images_type_index ON images (type)");
    txn.exec("CREATE INDEX IF NOT EXISTS images_uploaded_to_index ON images (uploaded_to)");

    txn.exec(R"SQL(
    CREATE TABLE IF NOT EXISTS cache (
        key        TEXT PRIMARY KEY,
        value      TEXT NOT NULL,
        expiration BIGINT NOT NULL
    )
    )SQL");

    // Widen columns of tables created by earlier releases; a no-op once they are TEXT.
    txn.exec("ALTER TABLE images ALTER COLUMN name TYPE TEXT, ALTER COLUMN url TYPE TEXT, ALTER COLUMN path TYPE TEXT");
    txn.exec("ALTER TABLE cache ALTER COLUMN key TYPE TEXT");

    // Owned by the host application; only created so a standalone database can be swept.
    txn.exec("CREATE TABLE IF NOT EXISTS pages (id SERIAL PRIMARY KEY, html TEXT NOT NULL DEFAULT '')");
    txn.exec(R"SQL(
    CREATE TABLE IF NOT EXISTS page_revisions (
        id      SERIAL PRIMARY KEY,
        page_id INTEGER NOT NULL,
        html    TEXT NOT NULL DEFAULT ''
    )
    )SQL");

    txn.commit();
    log::Registry::db()->debug("[schema] Tables ensured");
}
