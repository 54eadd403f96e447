#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "EventStore.hpp"

namespace potlog {

// Fire-and-forget event recording. emit() never blocks on the database; a
// worker thread drains the queue into the EventStore.
class EventSink {
public:
  explicit EventSink(EventStore& store, std::size_t capacity = 1000);
  ~EventSink();

  EventSink(const EventSink&) = delete;
  EventSink& operator=(const EventSink&) = delete;

  void emit(const std::string& eventType, const std::string& deviceId,
            const nlohmann::json& details = nlohmann::json::object());

  // Blocks until everything queued so far has been written.
  void flush();

private:
  void run();

  EventStore& store_;
  std::size_t capacity_;
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable drained_;
  std::deque<EventRecord> queue_;
  bool busy_ = false;
  bool stop_ = false;
  std::thread worker_;
};

} // namespace potlog
