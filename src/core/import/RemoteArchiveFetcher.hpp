#pragma once
#include <memory>
#include <string>

#include "core/io/ByteSource.hpp"

namespace potlog {

class ObjectStore;

// Downloads an export archive named by its public URL. Only URLs pointing at
// the import bucket are accepted, so the import path cannot be used to fetch
// arbitrary hosts.
class RemoteArchiveFetcher {
public:
  RemoteArchiveFetcher(ObjectStore& store, std::string bucket, std::string storeDomain,
                       std::string scratchDir);

  // Object key named by url; throws ValidationError for any other host.
  std::string keyFromUrl(const std::string& url) const;

  // The returned file is removed when released.
  std::unique_ptr<FileSource> fetch(const std::string& url, const std::string& deviceId);

private:
  ObjectStore& store_;
  std::string bucket_;
  std::string expectedHost_;
  std::string scratchDir_;
};

} // namespace potlog
