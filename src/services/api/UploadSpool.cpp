#include "UploadSpool.hpp"
#include "core/Errors.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace potlog {

static std::atomic<std::uint64_t> g_spoolSeq{0};

std::string SpooledForm::field(const std::string& name) const {
  auto it = fields.find(name);
  return it == fields.end() ? std::string() : it->second;
}

UploadSpool::UploadSpool(std::string scratchDir, std::string fileField)
  : scratchDir_(std::move(scratchDir)), fileField_(std::move(fileField)) {}

void UploadSpool::openSpoolFile() {
  std::error_code ec;
  fs::create_directories(scratchDir_, ec);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  const std::string path = (fs::path(scratchDir_) /
    ("upload-" + std::to_string(ms) + "-" + std::to_string(++g_spoolSeq) + ".part")).string();

  std::FILE* f = std::fopen(path.c_str(), "w+b");
  if (!f) throw IOError("cannot create upload file " + path + ": " + std::strerror(errno));
  form_.file = std::make_unique<FileSource>(f, path, true);
  out_ = f;
}

bool UploadSpool::beginPart(const std::string& name, const std::string& filename,
                            const std::string& contentType) {
  if (error_) return false;
  try {
    text_ = nullptr;
    inFile_ = false;
    if (name == fileField_ && !filename.empty()) {
      if (form_.file) throw ValidationError("Duplicate field " + fileField_);
      openSpoolFile();
      form_.filename = filename;
      form_.content_type = contentType;
      inFile_ = true;
    } else if (filename.empty()) {
      text_ = &form_.fields[name];
      text_->clear();
    }
    // any other file part is read and dropped
    return true;
  } catch (const std::exception&) {
    error_ = std::current_exception();
    return false;
  }
}

bool UploadSpool::append(const char* data, std::size_t len) {
  if (error_) return false;
  try {
    if (inFile_) {
      if (std::fwrite(data, 1, len, out_) != len) {
        throw IOError("cannot write upload to " + form_.file->path() + ": " + std::strerror(errno));
      }
    } else if (text_) {
      if (text_->size() + len > kMaxFieldBytes) throw ValidationError("Form field too large");
      text_->append(data, len);
    }
    return true;
  } catch (const std::exception&) {
    error_ = std::current_exception();
    return false;
  }
}

SpooledForm UploadSpool::finish() {
  if (error_) std::rethrow_exception(error_);
  if (form_.file) {
    if (std::fflush(out_) != 0) {
      throw IOError("cannot flush upload " + form_.file->path() + ": " + std::strerror(errno));
    }
    form_.file->seek(0);
  }
  out_ = nullptr;
  text_ = nullptr;
  inFile_ = false;
  return std::move(form_);
}

} // namespace potlog
