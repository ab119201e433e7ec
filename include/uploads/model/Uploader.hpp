#pragma once

#include <string>

namespace ih::uploads::model {

// Identity attached to an upload. System-initiated uploads carry none.
struct Uploader {
    unsigned int id{};
    std::string name;
    std::string email;
};

}
