#pragma once

#include <string>

namespace ih::db::query::content {

// Read-only view over the host application's page tables.
class Page {
public:
    [[nodiscard]] static unsigned int countPagesContaining(const std::string& needle);
    [[nodiscard]] static unsigned int countRevisionsContaining(const std::string& needle);
};

}
