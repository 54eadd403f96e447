#pragma once
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace potlog {

class RandomAccessSource;

struct ObjectAttributes {
  std::string acl;
  std::string cache_control;
  std::string content_type;
  std::chrono::system_clock::time_point expires;
};

struct CompletedPart {
  int         part_number;  // 1-based
  std::string etag;
};

// Remote content store. Every call that reaches the backend throws
// StorageError on failure, except headObject which reports absence.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  virtual bool headObject(const std::string& bucket, const std::string& key) = 0;

  virtual void putObject(const std::string& bucket, const std::string& key,
                         RandomAccessSource& body, const ObjectAttributes& attrs) = 0;

  // Returns the upload id.
  virtual std::string createMultipartUpload(const std::string& bucket, const std::string& key,
                                            const ObjectAttributes& attrs) = 0;
  // Returns the part's ETag.
  virtual std::string uploadPart(const std::string& bucket, const std::string& key,
                                 const std::string& uploadId, int partNumber,
                                 std::string_view data) = 0;
  virtual void completeMultipartUpload(const std::string& bucket, const std::string& key,
                                       const std::string& uploadId,
                                       const std::vector<CompletedPart>& parts) = 0;
  virtual void abortMultipartUpload(const std::string& bucket, const std::string& key,
                                    const std::string& uploadId) = 0;

  virtual void deleteObject(const std::string& bucket, const std::string& key) = 0;

  // Streams the object into out.
  virtual void getObject(const std::string& bucket, const std::string& key, std::FILE* out) = 0;
};

} // namespace potlog
