#include "ArchiveWriter.hpp"
#include "core/Errors.hpp"
#include "core/io/ByteSource.hpp"

#include <cstring>
#include <ctime>
#include <exception>
#include <limits>

namespace potlog {

namespace {

struct ReadContext {
  ByteSource* src;
  std::exception_ptr error;
};

size_t read_source(void* opaque, mz_uint64 /*file_ofs*/, void* buf, size_t n) {
  auto* ctx = static_cast<ReadContext*>(opaque);
  try {
    return ctx->src->readFull(static_cast<char*>(buf), n);
  } catch (const std::exception&) {
    ctx->error = std::current_exception();
    // any count above the requested size is a read failure to miniz
    return std::numeric_limits<size_t>::max();
  }
}

mz_uint16 comment_length(const std::string& comment) {
  if (comment.size() > std::numeric_limits<mz_uint16>::max()) {
    throw ValidationError("entry comment too long");
  }
  return static_cast<mz_uint16>(comment.size());
}

} // namespace

ArchiveWriter::ArchiveWriter(std::FILE* out) {
  mz_zip_zero_struct(&zip_);
  if (!mz_zip_writer_init_cfile(&zip_, out, MZ_ZIP_FLAG_WRITE_ZIP64)) {
    throw IOError("zip writer init failed: " + lastError());
  }
  open_ = true;
}

ArchiveWriter::~ArchiveWriter() {
  if (open_) mz_zip_writer_end(&zip_);
}

std::string ArchiveWriter::lastError() {
  return mz_zip_get_error_string(mz_zip_get_last_error(&zip_));
}

void ArchiveWriter::addEntry(const std::string& name, std::string_view data,
                             const std::string& comment) {
  if (!open_) throw IOError("zip writer already finalized");
  if (!mz_zip_writer_add_mem_ex(&zip_, name.c_str(), data.data(), data.size(),
                                comment.data(), comment_length(comment),
                                MZ_DEFAULT_LEVEL, 0, 0)) {
    throw IOError("cannot add " + name + " to archive: " + lastError());
  }
}

void ArchiveWriter::addEntry(const std::string& name, ByteSource& src, const std::string& comment) {
  if (!open_) throw IOError("zip writer already finalized");

  mz_uint64 maxSize = std::numeric_limits<mz_uint64>::max();
  if (RandomAccessSource* ra = src.randomAccess()) {
    maxSize = ra->size();
    // miniz writes no deflate stream for a zero-byte callback entry
    if (maxSize == 0) {
      addEntry(name, std::string_view(), comment);
      return;
    }
  }

  ReadContext ctx{&src, nullptr};
  MZ_TIME_T now = std::time(nullptr);
  mz_bool ok = mz_zip_writer_add_read_buf_callback(
    &zip_, name.c_str(), read_source, &ctx, maxSize, &now,
    comment.data(), comment_length(comment), MZ_DEFAULT_LEVEL,
    nullptr, 0, nullptr, 0);

  if (ctx.error) std::rethrow_exception(ctx.error);
  if (!ok) throw IOError("cannot add " + name + " to archive: " + lastError());
}

void ArchiveWriter::finalize() {
  if (!open_) throw IOError("zip writer already finalized");
  open_ = false;
  bool ok = mz_zip_writer_finalize_archive(&zip_);
  std::string err = ok ? std::string() : lastError();
  mz_zip_writer_end(&zip_);
  if (!ok) throw IOError("cannot finalize archive: " + err);
}

} // namespace potlog
