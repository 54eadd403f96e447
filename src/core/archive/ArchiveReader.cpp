#include "ArchiveReader.hpp"
#include "core/Errors.hpp"

namespace potlog {

namespace {

class EntrySource : public ByteSource {
public:
  EntrySource(mz_zip_reader_extract_iter_state* it, std::string name)
    : it_(it), name_(std::move(name)) {}

  ~EntrySource() override {
    if (it_) mz_zip_reader_extract_iter_free(it_);
  }

  std::size_t read(char* buf, std::size_t len) override {
    if (!it_ || len == 0) return 0;
    std::size_t n = mz_zip_reader_extract_iter_read(it_, buf, len);
    if (n > 0) return n;
    // zero means end of data or a failure; free() reports which
    mz_bool ok = mz_zip_reader_extract_iter_free(it_);
    it_ = nullptr;
    if (!ok) throw IOError("corrupt archive entry " + name_);
    return 0;
  }

private:
  mz_zip_reader_extract_iter_state* it_;
  std::string name_;
};

} // namespace

ArchiveReader::ArchiveReader(Token) {
  mz_zip_zero_struct(&zip_);
}

ArchiveReader::~ArchiveReader() {
  if (open_) mz_zip_reader_end(&zip_);
}

std::string ArchiveReader::lastError() {
  return mz_zip_get_error_string(mz_zip_get_last_error(&zip_));
}

std::unique_ptr<ArchiveReader> ArchiveReader::fromFile(const std::string& path) {
  auto r = std::make_unique<ArchiveReader>(Token{});
  if (!mz_zip_reader_init_file(&r->zip_, path.c_str(), 0)) {
    throw ValidationError("not a readable archive: " + r->lastError());
  }
  r->open_ = true;
  return r;
}

std::unique_ptr<ArchiveReader> ArchiveReader::fromMemory(std::string bytes) {
  auto r = std::make_unique<ArchiveReader>(Token{});
  r->buffer_ = std::move(bytes);
  if (!mz_zip_reader_init_mem(&r->zip_, r->buffer_.data(), r->buffer_.size(), 0)) {
    throw ValidationError("not a readable archive: " + r->lastError());
  }
  r->open_ = true;
  return r;
}

std::size_t ArchiveReader::entryCount() {
  return mz_zip_reader_get_num_files(&zip_);
}

ArchiveEntry ArchiveReader::entry(std::size_t i) {
  mz_zip_archive_file_stat st;
  if (!mz_zip_reader_file_stat(&zip_, static_cast<mz_uint>(i), &st)) {
    throw IOError("cannot stat archive entry " + std::to_string(i) + ": " + lastError());
  }
  ArchiveEntry e;
  e.index = static_cast<mz_uint>(i);
  e.name = st.m_filename;
  e.comment.assign(st.m_comment, st.m_comment_size);
  e.size = st.m_uncomp_size;
  e.directory = st.m_is_directory != 0;
  return e;
}

std::unique_ptr<ByteSource> ArchiveReader::openEntry(const ArchiveEntry& e) {
  mz_zip_reader_extract_iter_state* it = mz_zip_reader_extract_iter_new(&zip_, e.index, 0);
  if (!it) throw IOError("cannot open archive entry " + e.name + ": " + lastError());
  return std::make_unique<EntrySource>(it, e.name);
}

std::string ArchiveReader::readEntry(const ArchiveEntry& e) {
  return openEntry(e)->readAll();
}

} // namespace potlog
