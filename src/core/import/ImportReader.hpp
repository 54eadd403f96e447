#pragma once
#include <map>
#include <string>

namespace potlog {

class ArchiveReader;
class TransferManager;

struct ImportResult {
  std::string metadata;
  std::map<std::string, std::string> image_urls;  // entry name -> canonical URL
};

// Re-uploads the image entries of an export archive into the import bucket and
// returns them together with the archive's metadata entry.
class ImportReader {
public:
  explicit ImportReader(TransferManager& transfer) : transfer_(transfer) {}

  // Throws ValidationError if the archive has no metadata entry.
  ImportResult importArchive(ArchiveReader& archive, const std::string& deviceId);

private:
  TransferManager& transfer_;
};

} // namespace potlog
