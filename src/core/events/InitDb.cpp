// src/core/events/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace potlog {

static void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
        dbPath.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw std::runtime_error("Failed to open DB: " + msg);
    }

    try {
        // Event writes come from a single worker; WAL keeps readers unblocked
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=NORMAL;");
        execAll(db, "PRAGMA busy_timeout=5000;");

        std::ifstream in(schemaPath);
        if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
        std::ostringstream buf; buf << in.rdbuf();
        execAll(db, buf.str());

        execAll(db, "PRAGMA user_version=1;");

        sqlite3_close(db);
        return true;
    } catch (...) {
        sqlite3_close(db);
        throw;
    }
}

} // namespace potlog
