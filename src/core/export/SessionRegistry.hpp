#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "ExportSession.hpp"

namespace potlog {

enum class StartOutcome { Created, ReplacedAbandoned };

// Process-wide map from device id to its in-progress export. The map lock is
// never held across file I/O.
class SessionRegistry {
public:
  // scratchDir must exist; metadata copies go to <scratchDir>/metadata.
  explicit SessionRegistry(std::string scratchDir);

  // Starts a fresh export for the device. An unfinished export for the same
  // device is replaced and its staging file released.
  StartOutcome start(const std::string& deviceId, const std::string& metadata);

  std::shared_ptr<ExportSession> get(const std::string& deviceId);

  // Removes and returns the device's session in one step.
  std::shared_ptr<ExportSession> take(const std::string& deviceId);

  void remove(const std::string& deviceId);

  std::size_t size();

private:
  std::string stagingPath(const std::string& deviceId);
  void saveMetadataCopy(const std::string& deviceId, const std::string& metadata);

  std::string scratchDir_;
  std::atomic<std::uint64_t> seq_{0};
  std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<ExportSession>> sessions_;
};

// Throws ValidationError for ids that are empty or could leave the scratch
// directory when used in a file name.
void validateDeviceId(const std::string& deviceId);

} // namespace potlog
