#include "ImportReader.hpp"
#include "core/Errors.hpp"
#include "core/archive/ArchiveReader.hpp"
#include "core/archive/ArchiveWriter.hpp"
#include "core/storage/TransferManager.hpp"

#include <optional>

#include <spdlog/spdlog.h>

namespace potlog {

ImportResult ImportReader::importArchive(ArchiveReader& archive, const std::string& deviceId) {
  ImportResult result;
  std::optional<std::string> metadata;

  const std::size_t count = archive.entryCount();
  for (std::size_t i = 0; i < count; ++i) {
    ArchiveEntry entry = archive.entry(i);
    if (entry.directory) continue;

    if (entry.name == kMetadataEntryName) {
      metadata = archive.readEntry(entry);
      continue;
    }

    spdlog::info("uploading image file {} for {}", entry.name, deviceId);
    try {
      auto source = archive.openEntry(entry);
      result.image_urls[entry.name] = transfer_.uploadSingle(
        transfer_.config().import_bucket, *source, entry.name, entry.comment, deviceId);
    } catch (const Error& e) {
      spdlog::error("Error uploading image {} for {}: {}", entry.name, deviceId, e.what());
      throw;
    }
  }

  if (!metadata) {
    throw ValidationError(std::string("No ") + kMetadataEntryName + " found in the zip file");
  }
  result.metadata = std::move(*metadata);
  return result;
}

} // namespace potlog
