#include "EventSink.hpp"

#include <ctime>

#include <spdlog/spdlog.h>

namespace potlog {

EventSink::EventSink(EventStore& store, std::size_t capacity)
  : store_(store), capacity_(capacity), worker_(&EventSink::run, this) {}

EventSink::~EventSink() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  worker_.join();
}

void EventSink::emit(const std::string& eventType, const std::string& deviceId,
                     const nlohmann::json& details) {
  EventRecord r{eventType, deviceId.empty() ? "anonymous" : deviceId, details.dump(),
                static_cast<int64_t>(std::time(nullptr))};
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (queue_.size() >= capacity_) {
      spdlog::warn("event queue full, dropping {} for {}", r.event_type, r.device_id);
      return;
    }
    queue_.push_back(std::move(r));
  }
  cv_.notify_one();
}

void EventSink::flush() {
  std::unique_lock<std::mutex> lk(mu_);
  drained_.wait(lk, [this] { return queue_.empty() && !busy_; });
}

void EventSink::run() {
  std::unique_lock<std::mutex> lk(mu_);
  for (;;) {
    cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
    if (queue_.empty() && stop_) break;

    EventRecord r = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lk.unlock();
    try {
      store_.appendEvent(r);
    } catch (const std::exception& e) {
      spdlog::error("cannot record event {} for {}: {}", r.event_type, r.device_id, e.what());
    }
    lk.lock();
    busy_ = false;
    if (queue_.empty()) drained_.notify_all();
  }
  drained_.notify_all();
}

} // namespace potlog
