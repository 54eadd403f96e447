#include "ServerConfig.hpp"

#include <cstdlib>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace potlog {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static unsigned long long env_number_or(const char* key, unsigned long long defval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    return std::stoull(raw);
  } catch (const std::exception&) {
    spdlog::warn("{}={} is not a number, using {}", key, raw, defval);
    return defval;
  }
}

ServerConfig loadServerConfig() {
  ServerConfig c;
  const unsigned long long port = env_number_or("POTLOG_PORT", c.port);
  if (port == 0 || port > 65535) {
    spdlog::warn("POTLOG_PORT={} is not a valid port, using {}", port, c.port);
  } else {
    c.port = static_cast<int>(port);
  }
  c.db_path          = get_env_or("POTLOG_DB_PATH", c.db_path);
  c.scratch_dir      = get_env_or("POTLOG_SCRATCH_DIR", c.scratch_dir);
  c.debug_dir        = get_env_or("POTLOG_DEBUG_DIR", c.debug_dir);
  c.store            = get_env_or("POTLOG_STORE", c.store);
  c.local_store_root = get_env_or("POTLOG_LOCAL_STORE_ROOT", c.local_store_root);
  c.log_level        = get_env_or("POTLOG_LOG_LEVEL", c.log_level);

  c.s3.region        = get_env_or("POTLOG_S3_REGION", c.s3.region);
  c.s3.endpoint      = get_env_or("POTLOG_S3_ENDPOINT", c.s3.endpoint);
  c.s3.access_key    = get_env_or("AWS_ACCESS_KEY_ID", "");
  c.s3.secret_key    = get_env_or("AWS_SECRET_ACCESS_KEY", "");
  c.s3.session_token = get_env_or("AWS_SESSION_TOKEN", "");

  c.transfer.store_domain  = get_env_or("POTLOG_STORE_DOMAIN", c.transfer.store_domain);
  c.transfer.image_bucket  = get_env_or("POTLOG_IMAGE_BUCKET", c.transfer.image_bucket);
  c.transfer.import_bucket = get_env_or("POTLOG_IMPORT_BUCKET", c.transfer.import_bucket);
  c.transfer.multipart_threshold =
    env_number_or("POTLOG_MULTIPART_THRESHOLD", c.transfer.multipart_threshold);
  c.transfer.part_size = env_number_or("POTLOG_PART_SIZE", c.transfer.part_size);

  if (c.store != "s3" && c.store != "local") {
    throw std::runtime_error("POTLOG_STORE must be 's3' or 'local', got '" + c.store + "'");
  }
  return c;
}

} // namespace potlog
