#include "TransferManager.hpp"
#include "ContentType.hpp"
#include "core/Errors.hpp"
#include "core/io/ByteSource.hpp"

#include <chrono>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

namespace potlog {

static std::string object_key(const std::string& deviceId, const std::string& filename) {
  return deviceId + "/" + filename;
}

// Public, cacheable for a year.
static ObjectAttributes upload_attributes(const std::string& contentType) {
  ObjectAttributes a;
  a.acl = "public-read";
  a.cache_control = "max-age=31556926";
  a.content_type = contentType;
  a.expires = std::chrono::system_clock::now() + std::chrono::hours(24 * 365);
  return a;
}

TransferManager::TransferManager(ObjectStore& store, TransferConfig cfg)
  : store_(store), cfg_(std::move(cfg)) {
  if (cfg_.part_size == 0) throw ValidationError("part size must be positive");
}

std::string TransferManager::objectUrl(const std::string& bucket, const std::string& key) const {
  return "https://" + bucket + "." + cfg_.store_domain + "/" + key;
}

bool TransferManager::exists(const std::string& bucket, const std::string& key) {
  try {
    return store_.headObject(bucket, key);
  } catch (const StorageError& e) {
    spdlog::debug("exists {}/{}: {}", bucket, key, e.diagnostic());
    return false;
  }
}

std::string TransferManager::uploadSingle(const std::string& bucket, ByteSource& source,
                                          const std::string& filename, const std::string& contentType,
                                          const std::string& deviceId) {
  const std::string key = object_key(deviceId, filename);
  if (exists(bucket, key)) {
    spdlog::info("{} already in {}", key, bucket);
    return objectUrl(bucket, key);
  }

  std::string resolvedType = contentType;
  RandomAccessSource* body = source.randomAccess();
  std::unique_ptr<MemorySource> buffered;
  if (!body) {
    try {
      buffered = std::make_unique<MemorySource>(source.readAll());
    } catch (const IOError& e) {
      spdlog::error("cannot read {} into memory for device {}: {}", filename, deviceId, e.what());
      throw;
    }
    if (!looksLikeImageType(resolvedType)) resolvedType = sniffContentType(buffered->bytes());
    body = buffered.get();
  }

  try {
    store_.putObject(bucket, key, *body, upload_attributes(resolvedType));
  } catch (const StorageError& e) {
    spdlog::error("putObject {}/{} failed: {} ({})", bucket, key, e.what(), e.diagnostic());
    throw;
  }
  return objectUrl(bucket, key);
}

std::string TransferManager::uploadLarge(const std::string& bucket, RandomAccessSource& file,
                                         const std::string& filename, const std::string& contentType,
                                         const std::string& deviceId) {
  const std::uint64_t fileSize = file.size();
  if (fileSize < cfg_.multipart_threshold) {
    return uploadSingle(bucket, file, filename, contentType, deviceId);
  }

  const std::string key = object_key(deviceId, filename);
  if (exists(bucket, key)) {
    spdlog::info("{} already in {}", key, bucket);
    return objectUrl(bucket, key);
  }

  std::vector<char> buf(static_cast<std::size_t>(cfg_.part_size));
  std::string uploadId;
  try {
    uploadId = store_.createMultipartUpload(bucket, key, upload_attributes(contentType));
  } catch (const StorageError& e) {
    spdlog::error("createMultipartUpload {}/{} failed: {}", bucket, key, e.diagnostic());
    throw;
  }
  spdlog::info("multipart upload {} started for {}/{} ({} bytes)", uploadId, bucket, key, fileSize);

  std::vector<CompletedPart> parts;
  try {
    file.seek(0);
    for (int partNumber = 1;; ++partNumber) {
      std::size_t n = file.readFull(buf.data(), buf.size());
      if (n == 0) break;
      std::string etag = store_.uploadPart(bucket, key, uploadId, partNumber,
                                           std::string_view(buf.data(), n));
      parts.push_back({partNumber, std::move(etag)});
    }
  } catch (const StorageError& e) {
    spdlog::error("uploadPart {} for {}/{} failed: {}", parts.size() + 1, bucket, key, e.diagnostic());
    abortQuietly(bucket, key, uploadId);
    throw;
  } catch (const IOError& e) {
    spdlog::error("reading {} for device {} failed: {}", filename, deviceId, e.what());
    abortQuietly(bucket, key, uploadId);
    throw;
  }

  try {
    store_.completeMultipartUpload(bucket, key, uploadId, parts);
  } catch (const StorageError& e) {
    spdlog::error("completeMultipartUpload {}/{} failed: {}", bucket, key, e.diagnostic());
    throw;
  }
  return objectUrl(bucket, key);
}

void TransferManager::abortQuietly(const std::string& bucket, const std::string& key,
                                   const std::string& uploadId) {
  try {
    store_.abortMultipartUpload(bucket, key, uploadId);
  } catch (const StorageError& e) {
    spdlog::error("abortMultipartUpload {} for {}/{} failed: {}", uploadId, bucket, key, e.diagnostic());
  }
}

void TransferManager::deleteImage(const std::string& key) {
  try {
    store_.deleteObject(cfg_.image_bucket, key);
  } catch (const StorageError& e) {
    spdlog::error("deleteObject {}/{} failed: {}", cfg_.image_bucket, key, e.diagnostic());
    throw;
  }
}

} // namespace potlog
