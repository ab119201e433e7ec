#include "uploads/DatabaseContentIndex.hpp"
#include "db/query/content/Page.hpp"

using ih::db::query::content::Page;

namespace ih::uploads {

unsigned int DatabaseContentIndex::pagesContaining(const std::string& needle) {
    return Page::countPagesContaining(needle);
}

unsigned int DatabaseContentIndex::revisionsContaining(const std::string& needle) {
    return Page::countRevisionsContaining(needle);
}

}
