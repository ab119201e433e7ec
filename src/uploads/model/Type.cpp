#include "uploads/model/Type.hpp"

#include <algorithm>
#include <stdexcept>

namespace ih::uploads::model {

std::string to_string(const Type& type) {
    switch (type) {
        case Type::Gallery: return "gallery";
        case Type::Drawio: return "drawio";
        case Type::User: return "user";
        case Type::System: return "system";
        case Type::Cover: return "cover";
        default: return "unknown";
    }
}

Type type_from_string(const std::string& type) {
    if (type == "gallery") return Type::Gallery;
    if (type == "drawio") return Type::Drawio;
    if (type == "user") return Type::User;
    if (type == "system") return Type::System;
    if (type == "cover") return Type::Cover;
    throw std::invalid_argument("Invalid image type: " + type);
}

const std::vector<Type>& sweepableTypes() {
    static const std::vector<Type> types{Type::Gallery, Type::Drawio};
    return types;
}

bool isSweepable(const Type& type) {
    return std::ranges::find(sweepableTypes(), type) != sweepableTypes().end();
}

}
