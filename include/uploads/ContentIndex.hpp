#pragma once

#include <string>

namespace ih::uploads {

// Counts content rows whose raw body contains a substring.
class ContentIndex {
public:
    virtual ~ContentIndex() = default;

    [[nodiscard]] virtual unsigned int pagesContaining(const std::string& needle) = 0;
    [[nodiscard]] virtual unsigned int revisionsContaining(const std::string& needle) = 0;
};

}
