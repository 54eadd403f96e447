#pragma once
#include <string>

namespace potlog {

// Creates the database if needed and applies the schema file (idempotent).
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace potlog
