#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace potlog {

struct EventRecord {
  std::string event_type;
  std::string device_id;
  std::string details_json;
  int64_t     at;
};

// Append-only event table in SQLite. Safe to share between threads.
class EventStore {
public:
  explicit EventStore(const std::string& dbPath);
  ~EventStore();

  EventStore(const EventStore&) = delete;
  EventStore& operator=(const EventStore&) = delete;

  void appendEvent(const EventRecord& r);
  std::vector<EventRecord> eventsForDevice(const std::string& device_id);
  int64_t countEvents(const std::string& event_type);

private:
  void* db_; // sqlite3*
};

} // namespace potlog
