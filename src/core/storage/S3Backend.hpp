#pragma once
#include <map>
#include <string>

#include "ObjectStore.hpp"

namespace potlog {

struct S3Config {
  std::string region = "us-east-2";
  std::string endpoint;        // host suffix; empty means s3.<region>.amazonaws.com
  std::string access_key;
  std::string secret_key;
  std::string session_token;   // optional
};

// S3 REST API over HTTPS with Signature V4 request signing.
class S3Backend : public ObjectStore {
public:
  explicit S3Backend(S3Config cfg);

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

  using Params = std::map<std::string, std::string>;

  struct Signed {
    std::string path;                      // encoded path plus query string
    std::multimap<std::string, std::string> headers;
  };

  // Builds the request path and the signed headers for one call.
  Signed sign(const std::string& method, const std::string& bucket, const std::string& key,
              const Params& query, const Params& amzHeaders) const;
  Signed sign(const std::string& method, const std::string& bucket, const std::string& key,
              const Params& query, const Params& amzHeaders,
              const std::string& amzDate) const;

private:
  std::string host(const std::string& bucket) const;

  S3Config cfg_;
};

// Percent-encodes per SigV4 rules; '/' is kept when encodeSlash is false.
std::string uri_encode(const std::string& s, bool encodeSlash);

} // namespace potlog
