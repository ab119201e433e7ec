#include "db/query/content/Page.hpp"
#include "db/Transactions.hpp"

using namespace ih::db;
using namespace ih::db::query::content;

unsigned int Page::countPagesContaining(const std::string& needle) {
    return Transactions::exec("Page::countPagesContaining", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"count_pages_containing"}, pqxx::params{needle}).one_field().as<unsigned int>();
    });
}

unsigned int Page::countRevisionsContaining(const std::string& needle) {
    return Transactions::exec("Page::countRevisionsContaining", [&](pqxx::work& txn) {
        return txn.exec(pqxx::prepped{"count_page_revisions_containing"}, pqxx::params{needle})
                  .one_field().as<unsigned int>();
    });
}
