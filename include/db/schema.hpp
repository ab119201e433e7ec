#pragma once

#include <pqxx/connection>

namespace ih::db::schema {

// Creates the images and cache tables (and the read-only content tables when running standalone).
void ensure(pqxx::connection& conn);

}
