#pragma once

#include <string>
#include <vector>

namespace ih::uploads::model {

enum class Type { Gallery, Drawio, User, System, Cover };

std::string to_string(const Type& type);
Type type_from_string(const std::string& type);

// Types whose loss is recoverable; the only ones the orphan sweep may remove.
const std::vector<Type>& sweepableTypes();

bool isSweepable(const Type& type);

}
