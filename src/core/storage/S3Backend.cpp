#include "S3Backend.hpp"
#include "core/Errors.hpp"
#include "core/io/ByteSource.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <exception>
#include <memory>
#include <sstream>
#include <vector>

#include <httplib.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <spdlog/spdlog.h>

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

static std::string sha256_hex(std::string_view bytes) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!EVP_Digest(bytes.data(), bytes.size(), digest, &len, EVP_sha256(), nullptr)) {
    throw StorageError("storage request failed", "EVP_Digest(sha256) failed");
  }
  return to_hex(digest, len);
}

static std::string hmac_sha256(std::string_view key, std::string_view data) {
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &len)) {
    throw StorageError("storage request failed", "HMAC(sha256) failed");
  }
  return std::string(reinterpret_cast<const char*>(out), len);
}

static std::string utc_format(std::time_t t, const char* fmt) {
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), fmt, &tm);
  return buf;
}

static std::string http_date(std::chrono::system_clock::time_point tp) {
  return utc_format(std::chrono::system_clock::to_time_t(tp), "%a, %d %b %Y %H:%M:%S GMT");
}

static std::string xml_value(const std::string& body, const std::string& tag) {
  const std::string open = "<" + tag + ">";
  const std::string close = "</" + tag + ">";
  auto b = body.find(open);
  if (b == std::string::npos) return {};
  b += open.size();
  auto e = body.find(close, b);
  if (e == std::string::npos) return {};
  return body.substr(b, e - b);
}

static std::string trim(const std::string& s) {
  auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

std::string uri_encode(const std::string& s, bool encodeSlash) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encodeSlash)) {
      out += static_cast<char>(c);
    } else {
      out += '%';
      out += k[c >> 4];
      out += k[c & 0xF];
    }
  }
  return out;
}

static std::string describe(const char* op, const std::string& bucket, const std::string& key,
                            const httplib::Result& res) {
  std::ostringstream oss;
  oss << op << " " << bucket << "/" << key << ": ";
  if (!res) {
    oss << httplib::to_string(res.error());
  } else {
    oss << "HTTP " << res->status << " " << res->body;
  }
  return oss.str();
}

static bool ok_status(const httplib::Result& res) {
  return res && res->status >= 200 && res->status < 300;
}

static std::unique_ptr<httplib::Client> make_client(const std::string& host) {
  auto cli = std::make_unique<httplib::Client>("https://" + host);
  cli->set_url_encode(false);
  cli->set_connection_timeout(10);
  cli->set_read_timeout(300);
  cli->set_write_timeout(300);
  return cli;
}

static httplib::Headers to_headers(const S3Backend::Signed& s) {
  return httplib::Headers(s.headers.begin(), s.headers.end());
}

// ---------- signing ----------

S3Backend::S3Backend(S3Config cfg) : cfg_(std::move(cfg)) {
  if (cfg_.endpoint.empty()) cfg_.endpoint = "s3." + cfg_.region + ".amazonaws.com";
  if (cfg_.access_key.empty() || cfg_.secret_key.empty()) {
    spdlog::warn("S3 credentials are not set; requests will be rejected");
  }
}

std::string S3Backend::host(const std::string& bucket) const {
  return bucket + "." + cfg_.endpoint;
}

S3Backend::Signed S3Backend::sign(const std::string& method, const std::string& bucket,
                                  const std::string& key, const Params& query,
                                  const Params& amzHeaders) const {
  return sign(method, bucket, key, query, amzHeaders,
              utc_format(std::time(nullptr), "%Y%m%dT%H%M%SZ"));
}

S3Backend::Signed S3Backend::sign(const std::string& method, const std::string& bucket,
                                  const std::string& key, const Params& query,
                                  const Params& amzHeaders, const std::string& amzDate) const {
  static const std::string kPayload = "UNSIGNED-PAYLOAD";
  const std::string date = amzDate.substr(0, 8);

  const std::string canonicalUri = "/" + uri_encode(key, false);
  std::string canonicalQuery;
  for (const auto& [k, v] : query) {   // std::map keeps them sorted
    if (!canonicalQuery.empty()) canonicalQuery += "&";
    canonicalQuery += uri_encode(k, true) + "=" + uri_encode(v, true);
  }

  Params signedHeaders = amzHeaders;
  signedHeaders["host"] = host(bucket);
  signedHeaders["x-amz-content-sha256"] = kPayload;
  signedHeaders["x-amz-date"] = amzDate;
  if (!cfg_.session_token.empty()) signedHeaders["x-amz-security-token"] = cfg_.session_token;

  std::string canonicalHeaders, headerNames;
  for (const auto& [k, v] : signedHeaders) {
    canonicalHeaders += k + ":" + trim(v) + "\n";
    if (!headerNames.empty()) headerNames += ";";
    headerNames += k;
  }

  const std::string canonicalRequest =
    method + "\n" + canonicalUri + "\n" + canonicalQuery + "\n" +
    canonicalHeaders + "\n" + headerNames + "\n" + kPayload;

  const std::string scope = date + "/" + cfg_.region + "/s3/aws4_request";
  const std::string stringToSign =
    "AWS4-HMAC-SHA256\n" + amzDate + "\n" + scope + "\n" + sha256_hex(canonicalRequest);

  std::string k = hmac_sha256("AWS4" + cfg_.secret_key, date);
  k = hmac_sha256(k, cfg_.region);
  k = hmac_sha256(k, "s3");
  k = hmac_sha256(k, "aws4_request");
  const std::string sig = hmac_sha256(k, stringToSign);

  Signed out;
  out.path = canonicalUri + (canonicalQuery.empty() ? "" : "?" + canonicalQuery);
  for (const auto& [name, value] : signedHeaders) {
    if (name != "host") out.headers.emplace(name, value);
  }
  out.headers.emplace("Authorization",
    "AWS4-HMAC-SHA256 Credential=" + cfg_.access_key + "/" + scope +
    ", SignedHeaders=" + headerNames +
    ", Signature=" + to_hex(reinterpret_cast<const unsigned char*>(sig.data()), sig.size()));
  return out;
}

// ---------- operations ----------

bool S3Backend::headObject(const std::string& bucket, const std::string& key) {
  auto req = sign("HEAD", bucket, key, {}, {});
  auto res = make_client(host(bucket))->Head(req.path, to_headers(req));
  if (res && res->status != 200 && res->status != 404) {
    spdlog::warn("{}", describe("HEAD", bucket, key, res));
  }
  return res && res->status == 200;
}

void S3Backend::putObject(const std::string& bucket, const std::string& key,
                          RandomAccessSource& body, const ObjectAttributes& attrs) {
  auto req = sign("PUT", bucket, key, {}, {{"x-amz-acl", attrs.acl}});
  auto headers = to_headers(req);
  headers.emplace("Cache-Control", attrs.cache_control);
  headers.emplace("Expires", http_date(attrs.expires));

  std::exception_ptr readError;
  std::vector<char> buf(64 * 1024);
  auto provider = [&](size_t offset, size_t length, httplib::DataSink& sink) {
    try {
      body.seek(offset);
      size_t n = body.read(buf.data(), std::min(length, buf.size()));
      if (n == 0) return false;
      return sink.write(buf.data(), n);
    } catch (const std::exception&) {
      readError = std::current_exception();
      return false;
    }
  };

  auto res = make_client(host(bucket))->Put(req.path, headers,
                                            static_cast<size_t>(body.size()),
                                            provider, attrs.content_type);
  if (readError) std::rethrow_exception(readError);
  if (!ok_status(res)) {
    throw StorageError("storage upload failed", describe("PUT", bucket, key, res));
  }
}

std::string S3Backend::createMultipartUpload(const std::string& bucket, const std::string& key,
                                             const ObjectAttributes& attrs) {
  auto req = sign("POST", bucket, key, {{"uploads", ""}}, {{"x-amz-acl", attrs.acl}});
  auto headers = to_headers(req);
  headers.emplace("Cache-Control", attrs.cache_control);
  headers.emplace("Expires", http_date(attrs.expires));

  const std::string empty;
  auto res = make_client(host(bucket))->Post(req.path, headers, empty, attrs.content_type);
  if (!ok_status(res)) {
    throw StorageError("storage upload failed", describe("CreateMultipartUpload", bucket, key, res));
  }
  std::string uploadId = xml_value(res->body, "UploadId");
  if (uploadId.empty()) {
    throw StorageError("storage upload failed", "CreateMultipartUpload: no UploadId in " + res->body);
  }
  return uploadId;
}

std::string S3Backend::uploadPart(const std::string& bucket, const std::string& key,
                                  const std::string& uploadId, int partNumber,
                                  std::string_view data) {
  auto req = sign("PUT", bucket, key,
                  {{"partNumber", std::to_string(partNumber)}, {"uploadId", uploadId}}, {});
  auto res = make_client(host(bucket))->Put(req.path, to_headers(req), data.data(), data.size(),
                                            "application/octet-stream");
  if (!ok_status(res)) {
    throw StorageError("storage upload failed", describe("UploadPart", bucket, key, res));
  }
  std::string etag = res->get_header_value("ETag");
  if (etag.empty()) {
    throw StorageError("storage upload failed", "UploadPart: response without ETag");
  }
  return etag;
}

void S3Backend::completeMultipartUpload(const std::string& bucket, const std::string& key,
                                        const std::string& uploadId,
                                        const std::vector<CompletedPart>& parts) {
  std::ostringstream xml;
  xml << "<CompleteMultipartUpload>";
  for (const auto& p : parts) {
    xml << "<Part><PartNumber>" << p.part_number << "</PartNumber>"
        << "<ETag>" << p.etag << "</ETag></Part>";
  }
  xml << "</CompleteMultipartUpload>";

  auto req = sign("POST", bucket, key, {{"uploadId", uploadId}}, {});
  auto res = make_client(host(bucket))->Post(req.path, to_headers(req), xml.str(), "application/xml");
  // S3 may report a failed completion inside a 200 response
  if (!ok_status(res) || res->body.find("<Error>") != std::string::npos) {
    throw StorageError("storage upload failed", describe("CompleteMultipartUpload", bucket, key, res));
  }
}

void S3Backend::abortMultipartUpload(const std::string& bucket, const std::string& key,
                                     const std::string& uploadId) {
  auto req = sign("DELETE", bucket, key, {{"uploadId", uploadId}}, {});
  auto res = make_client(host(bucket))->Delete(req.path, to_headers(req));
  if (!ok_status(res)) {
    throw StorageError("storage abort failed", describe("AbortMultipartUpload", bucket, key, res));
  }
}

void S3Backend::deleteObject(const std::string& bucket, const std::string& key) {
  auto req = sign("DELETE", bucket, key, {}, {});
  auto res = make_client(host(bucket))->Delete(req.path, to_headers(req));
  if (!ok_status(res)) {
    throw StorageError("storage delete failed", describe("DELETE", bucket, key, res));
  }
}

void S3Backend::getObject(const std::string& bucket, const std::string& key, std::FILE* out) {
  auto req = sign("GET", bucket, key, {}, {});
  bool writeFailed = false;
  auto res = make_client(host(bucket))->Get(
    req.path, to_headers(req),
    [](const httplib::Response& r) { return r.status == 200; },
    [&](const char* data, size_t len) {
      if (std::fwrite(data, 1, len, out) != len) {
        writeFailed = true;
        return false;
      }
      return true;
    });
  if (writeFailed) throw IOError("cannot write downloaded " + key + " to disk");
  if (!res || res->status != 200) {
    throw StorageError("storage download failed", describe("GET", bucket, key, res));
  }
  if (std::fflush(out) != 0) throw IOError("cannot flush downloaded " + key);
}

} // namespace potlog
