#include "ExportSession.hpp"
#include "core/Errors.hpp"
#include "core/archive/ArchiveWriter.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace potlog {

ExportSession::ExportSession(std::string deviceId, const std::string& stagingPath,
                             const std::string& metadata)
  : deviceId_(std::move(deviceId)), path_(stagingPath) {
  spdlog::info("Starting export for {} at {}", deviceId_, path_);

  file_ = std::fopen(path_.c_str(), "w+b");  // truncates
  if (!file_) {
    throw IOError("cannot create staging file " + path_ + ": " + std::strerror(errno));
  }
  try {
    writer_ = std::make_unique<ArchiveWriter>(file_);
    writer_->addEntry(kMetadataEntryName, metadata);
  } catch (const Error&) {
    releaseLocked();
    throw;
  }
}

ExportSession::~ExportSession() {
  std::lock_guard<std::mutex> lk(mu_);
  releaseLocked();
}

ExportSession::State ExportSession::state() {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

void ExportSession::releaseLocked() {
  writer_.reset();
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
}

void ExportSession::addImage(ByteSource& source, const std::string& entryName,
                             const std::string& contentType) {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == State::Finished) throw StateError("The export has finished");
  writer_->addEntry(entryName, source, contentType);
}

std::unique_ptr<FileSource> ExportSession::finish() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == State::Finished) throw StateError("The export has finished");
  state_ = State::Finished;

  try {
    writer_->finalize();
    writer_.reset();
    if (std::fflush(file_) != 0 || std::fseek(file_, 0, SEEK_SET) != 0) {
      throw IOError("cannot rewind staging file " + path_ + ": " + std::strerror(errno));
    }
  } catch (const Error& e) {
    spdlog::error("finishing export for {} failed: {}", deviceId_, e.what());
    releaseLocked();
    throw;
  }

  auto sealed = std::make_unique<FileSource>(file_, path_, true);
  file_ = nullptr;
  return sealed;
}

void ExportSession::discard() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == State::Finished) return;
  state_ = State::Finished;
  releaseLocked();
}

} // namespace potlog
