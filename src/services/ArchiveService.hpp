#pragma once
#include <cstdint>
#include <string>

#include "core/export/SessionRegistry.hpp"
#include "core/import/ImportReader.hpp"

namespace potlog {

class ArchiveReader;
class ByteSource;
class EventSink;
class RemoteArchiveFetcher;
class TransferManager;

struct FinishedExport {
  std::string   url;
  std::uint64_t bytes;
};

// Operations behind the HTTP routes. Each validates its inputs, calls into
// the core and records an event on success.
class ArchiveService {
public:
  ArchiveService(SessionRegistry& registry, TransferManager& transfer, ImportReader& importer,
                 RemoteArchiveFetcher& fetcher, EventSink& events, std::string debugDir);

  std::string uploadImage(const std::string& deviceId, ByteSource& image,
                          const std::string& filename, const std::string& contentType);
  // uri is a canonical URL previously returned by uploadImage.
  void deleteImage(const std::string& uri);

  StartOutcome startExport(const std::string& deviceId, const std::string& metadata);
  void exportImage(const std::string& deviceId, ByteSource& image,
                   const std::string& filename, const std::string& contentType);
  FinishedExport finishExport(const std::string& deviceId);

  ImportResult importArchive(const std::string& deviceId, ArchiveReader& archive);
  ImportResult importFromUrl(const std::string& deviceId, const std::string& url);

  void saveDebug(const std::string& deviceId, const std::string& name,
                 const std::string& appOwnership, const std::string& data);

  void recordError(const std::string& deviceId, const std::string& message);

private:
  SessionRegistry& registry_;
  TransferManager& transfer_;
  ImportReader& importer_;
  RemoteArchiveFetcher& fetcher_;
  EventSink& events_;
  std::string debugDir_;
};

// pottery_log_export_YYYY_MM_DD.zip for the current local date.
std::string exportFileName();

} // namespace potlog
