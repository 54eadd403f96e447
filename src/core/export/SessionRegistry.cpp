#include "SessionRegistry.hpp"
#include "core/Errors.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace potlog {

void validateDeviceId(const std::string& deviceId) {
  if (deviceId.empty()) throw ValidationError("Missing required field deviceId");
  if (deviceId.find_first_of("/\\") != std::string::npos || deviceId.find("..") != std::string::npos) {
    throw ValidationError("Invalid deviceId");
  }
}

SessionRegistry::SessionRegistry(std::string scratchDir) : scratchDir_(std::move(scratchDir)) {
  fs::create_directories(fs::path(scratchDir_) / "metadata");
}

// Unique per session so a replaced session never shares a file with its successor.
std::string SessionRegistry::stagingPath(const std::string& deviceId) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  return (fs::path(scratchDir_) /
          (deviceId + "-" + std::to_string(ms) + "-" + std::to_string(++seq_) + ".zip")).string();
}

void SessionRegistry::saveMetadataCopy(const std::string& deviceId, const std::string& metadata) {
  const fs::path location = fs::path(scratchDir_) / "metadata" / (deviceId + ".json");
  std::ofstream os(location, std::ios::binary | std::ios::trunc);
  os.write(metadata.data(), static_cast<std::streamsize>(metadata.size()));
  os.flush();
  if (!os) throw IOError("cannot write metadata copy " + location.string());
}

StartOutcome SessionRegistry::start(const std::string& deviceId, const std::string& metadata) {
  validateDeviceId(deviceId);

  saveMetadataCopy(deviceId, metadata);
  auto fresh = std::make_shared<ExportSession>(deviceId, stagingPath(deviceId), metadata);

  std::shared_ptr<ExportSession> previous;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto& slot = sessions_[deviceId];
    previous = std::move(slot);
    slot = std::move(fresh);
  }

  if (!previous) return StartOutcome::Created;

  spdlog::warn("Replacing unfinished export for {} ({})", deviceId, previous->stagingPath());
  previous->discard();
  return StartOutcome::ReplacedAbandoned;
}

std::shared_ptr<ExportSession> SessionRegistry::get(const std::string& deviceId) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sessions_.find(deviceId);
  return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<ExportSession> SessionRegistry::take(const std::string& deviceId) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sessions_.find(deviceId);
  if (it == sessions_.end()) return nullptr;
  auto session = std::move(it->second);
  sessions_.erase(it);
  return session;
}

void SessionRegistry::remove(const std::string& deviceId) {
  std::lock_guard<std::mutex> lk(mu_);
  sessions_.erase(deviceId);
}

std::size_t SessionRegistry::size() {
  std::lock_guard<std::mutex> lk(mu_);
  return sessions_.size();
}

} // namespace potlog
