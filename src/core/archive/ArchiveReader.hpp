#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include <miniz.h>

#include "core/io/ByteSource.hpp"

namespace potlog {

struct ArchiveEntry {
  mz_uint     index = 0;
  std::string name;
  std::string comment;       // content-type hint for image entries
  std::uint64_t size = 0;    // uncompressed
  bool        directory = false;
};

class ArchiveReader {
  struct Token { explicit Token() = default; };

public:
  static std::unique_ptr<ArchiveReader> fromFile(const std::string& path);
  static std::unique_ptr<ArchiveReader> fromMemory(std::string bytes);

  // Use fromFile or fromMemory.
  explicit ArchiveReader(Token);
  ~ArchiveReader();
  ArchiveReader(const ArchiveReader&) = delete;
  ArchiveReader& operator=(const ArchiveReader&) = delete;

  std::size_t entryCount();
  ArchiveEntry entry(std::size_t i);

  // Sequential stream over the entry's decompressed bytes. Must not outlive
  // the reader.
  std::unique_ptr<ByteSource> openEntry(const ArchiveEntry& e);
  std::string readEntry(const ArchiveEntry& e);

private:
  std::string lastError();

  mz_zip_archive zip_;
  std::string buffer_;
  bool open_ = false;
};

} // namespace potlog
