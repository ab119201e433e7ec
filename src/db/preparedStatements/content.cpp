#include "db/DBConnection.hpp"

void ih::db::DBConnection::initPreparedContent() const {
    conn_->prepare("count_pages_containing", "SELECT COUNT(*) FROM pages WHERE strpos(html, $1) > 0");

    conn_->prepare("count_page_revisions_containing",
                   "SELECT COUNT(*) FROM page_revisions WHERE strpos(html, $1) > 0");
}
