#pragma once
#include <cstdint>
#include <string>

#include "ObjectStore.hpp"

namespace potlog {

class ByteSource;
class RandomAccessSource;

struct TransferConfig {
  std::string image_bucket  = "pottery-log";
  std::string import_bucket = "pottery-log-exports";
  std::string store_domain  = "s3.amazonaws.com";   // public URL host suffix
  std::uint64_t multipart_threshold = 1000000000;  // 1 GB
  std::uint64_t part_size           = 500000000;   // 500 MB
};

// Moves bytes into the object store under "<device_id>/<filename>".
// Uploads are skipped when the key already exists.
class TransferManager {
public:
  TransferManager(ObjectStore& store, TransferConfig cfg);

  std::string uploadSingle(const std::string& bucket, ByteSource& source,
                           const std::string& filename, const std::string& contentType,
                           const std::string& deviceId);

  // Multipart upload for files at or above the threshold, uploadSingle below it.
  std::string uploadLarge(const std::string& bucket, RandomAccessSource& file,
                          const std::string& filename, const std::string& contentType,
                          const std::string& deviceId);

  // Deletes a full key from the image bucket.
  void deleteImage(const std::string& key);

  // Any failure reads as absent.
  bool exists(const std::string& bucket, const std::string& key);

  std::string objectUrl(const std::string& bucket, const std::string& key) const;

  const TransferConfig& config() const { return cfg_; }

private:
  void abortQuietly(const std::string& bucket, const std::string& key, const std::string& uploadId);

  ObjectStore& store_;
  TransferConfig cfg_;
};

} // namespace potlog
