#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace potlog {

class RandomAccessSource;

// Sequential byte stream. read() returns 0 at end of stream and throws
// IOError on failure.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  virtual std::size_t read(char* buf, std::size_t len) = 0;

  // Non-null when the source also supports random access.
  virtual RandomAccessSource* randomAccess() { return nullptr; }

  // Reads until buf is full or the stream ends.
  std::size_t readFull(char* buf, std::size_t len);
  std::string readAll();
};

class RandomAccessSource : public ByteSource {
public:
  virtual std::uint64_t size() const = 0;
  virtual void seek(std::uint64_t offset) = 0;

  RandomAccessSource* randomAccess() override { return this; }
};

class MemorySource : public RandomAccessSource {
public:
  explicit MemorySource(std::string data) : data_(std::move(data)) {}

  std::size_t read(char* buf, std::size_t len) override;
  std::uint64_t size() const override { return data_.size(); }
  void seek(std::uint64_t offset) override;

  std::string_view bytes() const { return data_; }

private:
  std::string data_;
  std::size_t pos_ = 0;
};

// Owns an open stdio stream. With removeOnClose the backing file is deleted
// when the source is destroyed.
class FileSource : public RandomAccessSource {
public:
  FileSource(std::FILE* file, std::string path, bool removeOnClose);
  ~FileSource() override;

  FileSource(const FileSource&) = delete;
  FileSource& operator=(const FileSource&) = delete;

  static FileSource open(const std::string& path);

  FileSource(FileSource&& other) noexcept;

  std::size_t read(char* buf, std::size_t len) override;
  std::uint64_t size() const override;
  void seek(std::uint64_t offset) override;

  const std::string& path() const { return path_; }

private:
  std::FILE* file_;
  std::string path_;
  bool removeOnClose_;
};

} // namespace potlog
