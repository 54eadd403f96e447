#include "ByteSource.hpp"
#include "core/Errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sys/types.h>

namespace potlog {

std::size_t ByteSource::readFull(char* buf, std::size_t len) {
  std::size_t total = 0;
  while (total < len) {
    std::size_t n = read(buf + total, len - total);
    if (n == 0) break;
    total += n;
  }
  return total;
}

std::string ByteSource::readAll() {
  std::string out;
  char chunk[64 * 1024];
  for (;;) {
    std::size_t n = read(chunk, sizeof(chunk));
    if (n == 0) break;
    out.append(chunk, n);
  }
  return out;
}

// ---------- MemorySource ----------

std::size_t MemorySource::read(char* buf, std::size_t len) {
  std::size_t n = std::min(len, data_.size() - pos_);
  std::memcpy(buf, data_.data() + pos_, n);
  pos_ += n;
  return n;
}

void MemorySource::seek(std::uint64_t offset) {
  if (offset > data_.size()) throw IOError("seek past end of buffer");
  pos_ = static_cast<std::size_t>(offset);
}

// ---------- FileSource ----------

FileSource::FileSource(std::FILE* file, std::string path, bool removeOnClose)
  : file_(file), path_(std::move(path)), removeOnClose_(removeOnClose) {}

FileSource::FileSource(FileSource&& other) noexcept
  : file_(other.file_), path_(std::move(other.path_)), removeOnClose_(other.removeOnClose_) {
  other.file_ = nullptr;
  other.removeOnClose_ = false;
}

FileSource::~FileSource() {
  if (file_) std::fclose(file_);
  if (removeOnClose_ && !path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
}

FileSource FileSource::open(const std::string& path) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) throw IOError("cannot open " + path + ": " + std::strerror(errno));
  return FileSource(f, path, false);
}

std::size_t FileSource::read(char* buf, std::size_t len) {
  std::size_t n = std::fread(buf, 1, len, file_);
  if (n == 0 && std::ferror(file_)) {
    throw IOError("read failed on " + path_ + ": " + std::strerror(errno));
  }
  return n;
}

std::uint64_t FileSource::size() const {
  std::error_code ec;
  auto sz = std::filesystem::file_size(path_, ec);
  if (ec) throw IOError("cannot stat " + path_ + ": " + ec.message());
  return sz;
}

void FileSource::seek(std::uint64_t offset) {
  if (fseeko(file_, static_cast<off_t>(offset), SEEK_SET) != 0) {
    throw IOError("seek failed on " + path_ + ": " + std::strerror(errno));
  }
}

} // namespace potlog
