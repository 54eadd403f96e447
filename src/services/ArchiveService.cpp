#include "ArchiveService.hpp"
#include "core/Errors.hpp"
#include "core/archive/ArchiveReader.hpp"
#include "core/events/EventSink.hpp"
#include "core/import/RemoteArchiveFetcher.hpp"
#include "core/io/ByteSource.hpp"
#include "core/storage/TransferManager.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using nlohmann::json;

namespace potlog {

std::string exportFileName() {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "pottery_log_export_%Y_%m_%d.zip", &tm);
  return buf;
}

static void require(const std::string& value, const char* field) {
  if (value.empty()) throw ValidationError(std::string("Missing required field ") + field);
}

ArchiveService::ArchiveService(SessionRegistry& registry, TransferManager& transfer,
                               ImportReader& importer, RemoteArchiveFetcher& fetcher,
                               EventSink& events, std::string debugDir)
  : registry_(registry), transfer_(transfer), importer_(importer), fetcher_(fetcher),
    events_(events), debugDir_(std::move(debugDir)) {}

std::string ArchiveService::uploadImage(const std::string& deviceId, ByteSource& image,
                                        const std::string& filename, const std::string& contentType) {
  validateDeviceId(deviceId);
  require(filename, "image");

  std::string url = transfer_.uploadSingle(transfer_.config().image_bucket, image, filename,
                                           contentType, deviceId);
  events_.emit("server-upload", deviceId);
  spdlog::info("Uploaded image to {}", url);
  return url;
}

void ArchiveService::deleteImage(const std::string& uri) {
  require(uri, "uri");
  const std::string marker = transfer_.config().store_domain + "/";
  const auto pos = uri.find(marker);
  if (pos == std::string::npos || uri.find(marker, pos + 1) != std::string::npos ||
      pos + marker.size() == uri.size()) {
    throw ValidationError("Can't parse uri " + uri);
  }
  const std::string key = uri.substr(pos + marker.size());

  transfer_.deleteImage(key);
  events_.emit("server-delete", "");
  spdlog::info("Deleted image {}", key);
}

StartOutcome ArchiveService::startExport(const std::string& deviceId, const std::string& metadata) {
  validateDeviceId(deviceId);
  require(metadata, "metadata");

  StartOutcome outcome = registry_.start(deviceId, metadata);
  events_.emit("server-start-export", deviceId,
               {{"replaced", outcome == StartOutcome::ReplacedAbandoned}});
  return outcome;
}

void ArchiveService::exportImage(const std::string& deviceId, ByteSource& image,
                                 const std::string& filename, const std::string& contentType) {
  validateDeviceId(deviceId);
  require(filename, "image");

  auto session = registry_.get(deviceId);
  if (!session) throw StateError("There is no export");

  session->addImage(image, filename, contentType);
  events_.emit("server-export-image", deviceId);
  spdlog::info("Exported an image for device {}.", deviceId);
}

FinishedExport ArchiveService::finishExport(const std::string& deviceId) {
  validateDeviceId(deviceId);

  auto session = registry_.take(deviceId);
  if (!session) throw StateError("There is no export");

  std::unique_ptr<FileSource> archive = session->finish();
  FinishedExport out;
  out.bytes = archive->size();
  out.url = transfer_.uploadLarge(transfer_.config().import_bucket, *archive, exportFileName(),
                                  "application/zip", deviceId);

  events_.emit("server-finish-export", deviceId, {{"bytes", out.bytes}});
  spdlog::info("Finished the export for device {} available at {}.", deviceId, out.url);
  return out;
}

ImportResult ArchiveService::importArchive(const std::string& deviceId, ArchiveReader& archive) {
  validateDeviceId(deviceId);

  ImportResult result = importer_.importArchive(archive, deviceId);
  events_.emit("server-import", deviceId, {{"images", result.image_urls.size()}});
  spdlog::info("Imported for device {}.", deviceId);
  return result;
}

ImportResult ArchiveService::importFromUrl(const std::string& deviceId, const std::string& url) {
  validateDeviceId(deviceId);
  require(url, "importURL");

  std::unique_ptr<FileSource> local = fetcher_.fetch(url, deviceId);
  auto archive = ArchiveReader::fromFile(local->path());
  return importArchive(deviceId, *archive);
}

void ArchiveService::saveDebug(const std::string& deviceId, const std::string& name,
                               const std::string& appOwnership, const std::string& data) {
  validateDeviceId(deviceId);
  if (name.find_first_of("/\\") != std::string::npos || name.find("..") != std::string::npos) {
    throw ValidationError("Invalid name");
  }
  const std::string ownership = appOwnership.empty() ? "none" : appOwnership;
  if (ownership.find_first_of("/\\") != std::string::npos || ownership.find("..") != std::string::npos) {
    throw ValidationError("Invalid appOwnership");
  }

  const std::string filename = ownership + "-" + deviceId + "-" +
    std::to_string(std::time(nullptr)) + "-" + name + ".log";
  const auto path = std::filesystem::path(debugDir_) / filename;

  std::ofstream os(path, std::ios::binary | std::ios::trunc);
  os.write(data.data(), static_cast<std::streamsize>(data.size()));
  os.flush();
  if (!os) throw IOError("cannot write debug file " + path.string());
  spdlog::info("Saved debug data for {}.", deviceId);
}

void ArchiveService::recordError(const std::string& deviceId, const std::string& message) {
  events_.emit("server-error", deviceId, {{"message", message}});
}

} // namespace potlog
