#include "EventStore.hpp"
#include <stdexcept>
#include <sqlite3.h>

namespace potlog {

EventStore::EventStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr)!=SQLITE_OK) {
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + dbPath);
  }
  db_ = db;
}

EventStore::~EventStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void EventStore::appendEvent(const EventRecord& r) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO events (event_type, device_id, details, at)
    VALUES (?,?,?,?)
  )SQL";
  sqlite3_stmt* st=nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("appendEvent prepare failed: ") + sqlite3_errmsg(db));
  }
  sqlite3_bind_text(st, 1, r.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 2, r.device_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, 3, r.details_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, 4, r.at);

  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("appendEvent failed: " + err);
  }
  sqlite3_finalize(st);
}

std::vector<EventRecord> EventStore::eventsForDevice(const std::string& device_id) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT event_type, device_id, details, at FROM events
    WHERE device_id = ? ORDER BY id
  )SQL";
  sqlite3_stmt* st=nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("eventsForDevice prepare failed: ") + sqlite3_errmsg(db));
  }
  sqlite3_bind_text(st, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);

  auto text = [&](int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
  };

  std::vector<EventRecord> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back({text(0), text(1), text(2), sqlite3_column_int64(st, 3)});
  }
  if (rc != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("eventsForDevice failed: " + err);
  }
  sqlite3_finalize(st);
  return out;
}

int64_t EventStore::countEvents(const std::string& event_type) {
  auto* db = static_cast<sqlite3*>(db_);
  sqlite3_stmt* st=nullptr;
  if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM events WHERE event_type = ?", -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("countEvents prepare failed: ") + sqlite3_errmsg(db));
  }
  sqlite3_bind_text(st, 1, event_type.c_str(), -1, SQLITE_TRANSIENT);
  int64_t n = 0;
  if (sqlite3_step(st) == SQLITE_ROW) n = sqlite3_column_int64(st, 0);
  sqlite3_finalize(st);
  return n;
}

} // namespace potlog
