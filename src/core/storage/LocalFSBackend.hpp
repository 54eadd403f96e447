#pragma once
#include <filesystem>
#include <string>

#include "ObjectStore.hpp"

namespace potlog {

// ObjectStore on the local filesystem. Objects live at <root>/<bucket>/<key>,
// their attributes in a JSON sidecar under <root>/.attrs, and in-flight
// multipart uploads under <root>/.multipart/<upload-id>.
class LocalFSBackend : public ObjectStore {
public:
  explicit LocalFSBackend(std::string root);

  bool headObject(const std::string& bucket, const std::string& key) override;
  void putObject(const std::string& bucket, const std::string& key,
                 RandomAccessSource& body, const ObjectAttributes& attrs) override;

  std::string createMultipartUpload(const std::string& bucket, const std::string& key,
                                    const ObjectAttributes& attrs) override;
  std::string uploadPart(const std::string& bucket, const std::string& key,
                         const std::string& uploadId, int partNumber,
                         std::string_view data) override;
  void completeMultipartUpload(const std::string& bucket, const std::string& key,
                               const std::string& uploadId,
                               const std::vector<CompletedPart>& parts) override;
  void abortMultipartUpload(const std::string& bucket, const std::string& key,
                            const std::string& uploadId) override;

  void deleteObject(const std::string& bucket, const std::string& key) override;
  void getObject(const std::string& bucket, const std::string& key, std::FILE* out) override;

  // Reads back the stored attributes; throws StorageError if absent.
  ObjectAttributes attributes(const std::string& bucket, const std::string& key);

private:
  std::filesystem::path objectPath(const std::string& bucket, const std::string& key) const;
  std::filesystem::path attrsPath(const std::string& bucket, const std::string& key) const;
  std::filesystem::path uploadDir(const std::string& uploadId) const;
  void writeAttrs(const std::filesystem::path& file, const ObjectAttributes& attrs);

  std::filesystem::path root_;
};

} // namespace potlog
