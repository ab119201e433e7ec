#pragma once

#include "uploads/ContentIndex.hpp"

namespace ih::uploads {

class DatabaseContentIndex final : public ContentIndex {
public:
    [[nodiscard]] unsigned int pagesContaining(const std::string& needle) override;
    [[nodiscard]] unsigned int revisionsContaining(const std::string& needle) override;
};

}
