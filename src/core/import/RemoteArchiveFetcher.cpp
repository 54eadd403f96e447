#include "RemoteArchiveFetcher.hpp"
#include "core/Errors.hpp"
#include "core/storage/ObjectStore.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace potlog {

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static std::string percent_decode(const std::string& s) {
  std::string out;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%') {
      int hi = i + 2 < s.size() ? hex_value(s[i + 1]) : -1;
      int lo = i + 2 < s.size() ? hex_value(s[i + 2]) : -1;
      if (hi < 0 || lo < 0) throw ValidationError("Malformed import URL");
      out += static_cast<char>(hi * 16 + lo);
      i += 2;
    } else {
      out += s[i];
    }
  }
  return out;
}

RemoteArchiveFetcher::RemoteArchiveFetcher(ObjectStore& store, std::string bucket,
                                           std::string storeDomain, std::string scratchDir)
  : store_(store),
    bucket_(std::move(bucket)),
    expectedHost_(bucket_ + "." + storeDomain),
    scratchDir_(std::move(scratchDir)) {}

std::string RemoteArchiveFetcher::keyFromUrl(const std::string& url) const {
  static const std::string kScheme = "https://";
  if (url.compare(0, kScheme.size(), kScheme) != 0) {
    throw ValidationError("The link must be a Pottery Log export link");
  }
  const std::string rest = url.substr(kScheme.size());
  const auto slash = rest.find('/');
  const std::string authority = rest.substr(0, slash);
  if (authority != expectedHost_) {
    throw ValidationError("The link must be a Pottery Log export link");
  }
  if (slash == std::string::npos) throw ValidationError("Import URL names no file");

  std::string path = rest.substr(slash + 1);
  path = path.substr(0, path.find_first_of("?#"));
  std::string key = percent_decode(path);
  if (key.empty()) throw ValidationError("Import URL names no file");
  return key;
}

std::unique_ptr<FileSource> RemoteArchiveFetcher::fetch(const std::string& url,
                                                        const std::string& deviceId) {
  const std::string key = keyFromUrl(url);

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  const std::string localFile = (std::filesystem::path(scratchDir_) /
    ("import-" + deviceId + "-" + std::to_string(ms) + ".zip")).string();

  std::FILE* f = std::fopen(localFile.c_str(), "w+b");
  if (!f) throw IOError("cannot create " + localFile + ": " + std::strerror(errno));
  // owns f from here on and removes the file on every exit path
  auto file = std::make_unique<FileSource>(f, localFile, true);

  spdlog::info("Downloading {} to {}", url, localFile);
  try {
    store_.getObject(bucket_, key, f);
  } catch (const StorageError& e) {
    spdlog::error("download of {} failed: {}", key, e.diagnostic());
    throw;
  }
  file->seek(0);
  spdlog::info("Finished downloading {}", key);
  return file;
}

} // namespace potlog
