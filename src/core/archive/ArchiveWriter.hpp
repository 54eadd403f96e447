#pragma once
#include <cstdio>
#include <string>
#include <string_view>

#include <miniz.h>

namespace potlog {

class ByteSource;

// Name of the reserved entry holding the device's JSON metadata.
inline constexpr const char* kMetadataEntryName = "metadata.json";

// Streaming zip writer on top of a caller-owned stdio stream. Entries are
// deflated as they are read, so the source is never held in memory whole.
class ArchiveWriter {
public:
  explicit ArchiveWriter(std::FILE* out);
  ~ArchiveWriter();

  ArchiveWriter(const ArchiveWriter&) = delete;
  ArchiveWriter& operator=(const ArchiveWriter&) = delete;

  void addEntry(const std::string& name, std::string_view data,
                const std::string& comment = std::string());

  // Copies src into a new entry. A failed copy leaves a partial entry behind.
  void addEntry(const std::string& name, ByteSource& src, const std::string& comment);

  // Writes the central directory. The writer is unusable afterwards.
  void finalize();

private:
  std::string lastError();

  mz_zip_archive zip_;
  bool open_ = false;
};

} // namespace potlog
