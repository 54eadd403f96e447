#pragma once
#include <string>

#include "core/storage/S3Backend.hpp"
#include "core/storage/TransferManager.hpp"

namespace potlog {

struct ServerConfig {
  int         port             = 9292;
  std::string db_path          = "data/potlog-events.db";
  std::string scratch_dir      = "/tmp/pottery-log-exports";
  std::string debug_dir        = "/tmp/pottery-log";
  std::string store            = "s3";            // "s3" or "local"
  std::string local_store_root = "data/objects";
  std::string log_level        = "info";
  S3Config       s3;
  TransferConfig transfer;
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads POTLOG_* and AWS_* environment variables over the defaults above.
ServerConfig loadServerConfig();

} // namespace potlog
