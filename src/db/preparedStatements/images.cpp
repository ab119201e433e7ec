#include "db/DBConnection.hpp"

void ih::db::DBConnection::initPreparedImages() const {
    conn_->prepare("insert_image",
                   "INSERT INTO images (name, url, path, type, uploaded_to, created_by, updated_by) "
                   "VALUES ($1, $2, $3, $4, $5, $6, $7) RETURNING *");

    conn_->prepare("update_image",
                   R"SQL(
    UPDATE images
    SET name        = $2,
        url         = $3,
        uploaded_to = $4,
        created_by  = $5,
        updated_by  = $6,
        updated_at  = CURRENT_TIMESTAMP
    WHERE id = $1
    RETURNING updated_at
    )SQL");

    conn_->prepare("delete_image", "DELETE FROM images WHERE id = $1");

    conn_->prepare("get_image", "SELECT * FROM images WHERE id = $1");

    // keyset pagination keeps batches stable while rows are deleted
    conn_->prepare("list_images_by_types_after",
                   "SELECT * FROM images WHERE type = ANY($1::text[]) AND id > $2 ORDER BY id ASC LIMIT $3");
}
