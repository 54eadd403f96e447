#include "LocalFSBackend.hpp"
#include "core/Errors.hpp"
#include "core/io/ByteSource.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

using nlohmann::json;
namespace fs = std::filesystem;

namespace potlog {

// ---------- helpers ----------

static std::string to_hex(const unsigned char* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

static std::string md5_hex(std::string_view bytes) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!EVP_Digest(bytes.data(), bytes.size(), digest, &len, EVP_md5(), nullptr)) {
    throw StorageError("local store failure", "EVP_Digest(md5) failed");
  }
  return to_hex(digest, len);
}

static std::string random_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::ostringstream oss;
  oss << std::hex << rng() << rng();
  return oss.str();
}

// Rejects names that would resolve outside the store root.
static void check_relative(const std::string& name) {
  fs::path p(name);
  if (name.empty() || p.is_absolute()) {
    throw StorageError("invalid object name", "bad path: " + name);
  }
  for (const auto& part : p) {
    if (part == "..") throw StorageError("invalid object name", "bad path: " + name);
  }
}

static void write_file(const fs::path& file, std::string_view bytes) {
  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  std::ofstream os(file, std::ios::binary | std::ios::trunc);
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw StorageError("local store write failed", "cannot write " + file.string());
}

// Readers only ever see a complete object.
static void publish(const fs::path& tmp, const fs::path& target) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw StorageError("local store write failed", "rename to " + target.string() + " failed");
  }
}

static json attrs_to_json(const ObjectAttributes& a) {
  return json{
    {"acl", a.acl},
    {"cache_control", a.cache_control},
    {"content_type", a.content_type},
    {"expires", std::chrono::duration_cast<std::chrono::seconds>(
                  a.expires.time_since_epoch()).count()}
  };
}

static ObjectAttributes attrs_from_json(const json& j) {
  ObjectAttributes a;
  a.acl = j.value("acl", "");
  a.cache_control = j.value("cache_control", "");
  a.content_type = j.value("content_type", "");
  a.expires = std::chrono::system_clock::time_point(
    std::chrono::seconds(j.value("expires", static_cast<int64_t>(0))));
  return a;
}

static json read_json(const fs::path& file) {
  std::ifstream in(file);
  if (!in) throw StorageError("object not found", "cannot open " + file.string());
  try {
    return json::parse(in);
  } catch (const json::exception& e) {
    throw StorageError("local store failure", file.string() + ": " + e.what());
  }
}

// ---------- LocalFSBackend ----------

LocalFSBackend::LocalFSBackend(std::string root) : root_(std::move(root)) {
  fs::create_directories(root_);
}

fs::path LocalFSBackend::objectPath(const std::string& bucket, const std::string& key) const {
  check_relative(bucket);
  check_relative(key);
  return root_ / bucket / key;
}

fs::path LocalFSBackend::attrsPath(const std::string& bucket, const std::string& key) const {
  check_relative(bucket);
  check_relative(key);
  return root_ / ".attrs" / bucket / (key + ".json");
}

fs::path LocalFSBackend::uploadDir(const std::string& uploadId) const {
  check_relative(uploadId);
  return root_ / ".multipart" / uploadId;
}

void LocalFSBackend::writeAttrs(const fs::path& file, const ObjectAttributes& attrs) {
  write_file(file, attrs_to_json(attrs).dump());
}

bool LocalFSBackend::headObject(const std::string& bucket, const std::string& key) {
  std::error_code ec;
  return fs::is_regular_file(objectPath(bucket, key), ec);
}

void LocalFSBackend::putObject(const std::string& bucket, const std::string& key,
                               RandomAccessSource& body, const ObjectAttributes& attrs) {
  const fs::path target = objectPath(bucket, key);
  const fs::path tmp = target.string() + ".tmp-" + random_id();
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);

  body.seek(0);
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw StorageError("local store write failed", "cannot create " + tmp.string());
    char buf[64 * 1024];
    for (;;) {
      std::size_t n = body.read(buf, sizeof(buf));
      if (n == 0) break;
      os.write(buf, static_cast<std::streamsize>(n));
    }
    os.flush();
    if (!os) {
      fs::remove(tmp, ec);
      throw StorageError("local store write failed", "short write to " + tmp.string());
    }
  }
  writeAttrs(attrsPath(bucket, key), attrs);
  publish(tmp, target);
}

std::string LocalFSBackend::createMultipartUpload(const std::string& bucket, const std::string& key,
                                                  const ObjectAttributes& attrs) {
  objectPath(bucket, key);  // validates the names
  const std::string id = random_id();
  json j = {{"bucket", bucket}, {"key", key}, {"attrs", attrs_to_json(attrs)}};
  write_file(uploadDir(id) / "upload.json", j.dump());
  return id;
}

std::string LocalFSBackend::uploadPart(const std::string& bucket, const std::string& key,
                                       const std::string& uploadId, int partNumber,
                                       std::string_view data) {
  const fs::path dir = uploadDir(uploadId);
  json upload = read_json(dir / "upload.json");
  if (upload.value("bucket", "") != bucket || upload.value("key", "") != key) {
    throw StorageError("no such upload", "upload " + uploadId + " is for another object");
  }
  if (partNumber < 1) {
    throw StorageError("invalid part number", "part " + std::to_string(partNumber));
  }
  write_file(dir / (std::to_string(partNumber) + ".part"), data);
  return md5_hex(data);
}

void LocalFSBackend::completeMultipartUpload(const std::string& bucket, const std::string& key,
                                             const std::string& uploadId,
                                             const std::vector<CompletedPart>& parts) {
  const fs::path dir = uploadDir(uploadId);
  json upload = read_json(dir / "upload.json");
  if (upload.value("bucket", "") != bucket || upload.value("key", "") != key) {
    throw StorageError("no such upload", "upload " + uploadId + " is for another object");
  }
  if (parts.empty()) throw StorageError("malformed part list", "no parts");

  const fs::path target = objectPath(bucket, key);
  const fs::path tmp = target.string() + ".tmp-" + uploadId;
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    int expected = 1;
    for (const auto& p : parts) {
      if (p.part_number != expected++) {
        os.close(); fs::remove(tmp, ec);
        throw StorageError("malformed part list",
                           "part " + std::to_string(p.part_number) + " out of order");
      }
      std::ifstream in(dir / (std::to_string(p.part_number) + ".part"), std::ios::binary);
      std::ostringstream data; data << in.rdbuf();
      if (!in || md5_hex(data.str()) != p.etag) {
        os.close(); fs::remove(tmp, ec);
        throw StorageError("invalid part", "part " + std::to_string(p.part_number) + " etag mismatch");
      }
      os << data.str();
    }
    os.flush();
    if (!os) {
      fs::remove(tmp, ec);
      throw StorageError("local store write failed", "short write to " + tmp.string());
    }
  }
  writeAttrs(attrsPath(bucket, key), attrs_from_json(upload["attrs"]));
  publish(tmp, target);
  fs::remove_all(dir, ec);
}

void LocalFSBackend::abortMultipartUpload(const std::string& /*bucket*/, const std::string& /*key*/,
                                          const std::string& uploadId) {
  const fs::path dir = uploadDir(uploadId);
  std::error_code ec;
  if (!fs::exists(dir, ec)) throw StorageError("no such upload", "upload " + uploadId);
  fs::remove_all(dir, ec);
  if (ec) throw StorageError("abort failed", ec.message());
}

void LocalFSBackend::deleteObject(const std::string& bucket, const std::string& key) {
  std::error_code ec;
  fs::remove(objectPath(bucket, key), ec);
  if (ec) throw StorageError("delete failed", ec.message());
  fs::remove(attrsPath(bucket, key), ec);
}

void LocalFSBackend::getObject(const std::string& bucket, const std::string& key, std::FILE* out) {
  std::ifstream in(objectPath(bucket, key), std::ios::binary);
  if (!in) throw StorageError("object not found", "no object " + bucket + "/" + key);
  char buf[64 * 1024];
  while (in) {
    in.read(buf, sizeof(buf));
    std::streamsize n = in.gcount();
    if (n > 0 && std::fwrite(buf, 1, static_cast<size_t>(n), out) != static_cast<size_t>(n)) {
      throw StorageError("download failed", "local write failed");
    }
  }
  if (std::fflush(out) != 0) throw StorageError("download failed", "flush failed");
}

ObjectAttributes LocalFSBackend::attributes(const std::string& bucket, const std::string& key) {
  return attrs_from_json(read_json(attrsPath(bucket, key)));
}

} // namespace potlog
