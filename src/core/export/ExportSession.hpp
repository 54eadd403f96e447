#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "core/io/ByteSource.hpp"

namespace potlog {

class ArchiveWriter;

// One device's in-progress export: a zip being written to a staging file that
// nothing else touches while the session is open.
class ExportSession {
public:
  enum class State { Open, Finished };

  // Creates the staging file and writes the metadata entry.
  ExportSession(std::string deviceId, const std::string& stagingPath, const std::string& metadata);
  ~ExportSession();

  ExportSession(const ExportSession&) = delete;
  ExportSession& operator=(const ExportSession&) = delete;

  // Streams source into a new entry. Throws StateError once finished.
  void addImage(ByteSource& source, const std::string& entryName, const std::string& contentType);

  // Seals the archive and hands the rewound staging file to the caller.
  // Releasing the returned source deletes the file.
  std::unique_ptr<FileSource> finish();

  // Marks the session finished and drops the staging file. No-op if already
  // finished.
  void discard();

  const std::string& deviceId() const { return deviceId_; }
  const std::string& stagingPath() const { return path_; }
  State state();

private:
  void releaseLocked();

  std::string deviceId_;
  std::string path_;
  std::mutex mu_;
  State state_ = State::Open;
  std::FILE* file_ = nullptr;
  std::unique_ptr<ArchiveWriter> writer_;
};

} // namespace potlog
