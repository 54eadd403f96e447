// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/config/ServerConfig.hpp"
#include "core/events/EventSink.hpp"
#include "core/events/EventStore.hpp"
#include "core/events/InitDb.hpp"
#include "core/export/SessionRegistry.hpp"
#include "core/import/ImportReader.hpp"
#include "core/import/RemoteArchiveFetcher.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/S3Backend.hpp"
#include "core/storage/TransferManager.hpp"
#include "services/ArchiveService.hpp"
#include "services/api/HttpServer.hpp"

using namespace potlog;

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/events/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/events)");
}

static std::unique_ptr<ObjectStore> makeStore(const ServerConfig& cfg) {
  if (cfg.store == "local") {
    spdlog::info("Using local object store at {}", cfg.local_store_root);
    return std::make_unique<LocalFSBackend>(cfg.local_store_root);
  }
  spdlog::info("Using S3 object store in {}", cfg.s3.region);
  return std::make_unique<S3Backend>(cfg.s3);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite event schema\n"
            << "  " << argv0 << " --serve       # start HTTP server (POTLOG_PORT or 9292)\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const ServerConfig cfg = loadServerConfig();
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      initDatabase(cfg.db_path, findSchemaPath());
      std::cout << "DB initialized at: " << cfg.db_path << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "--serve") {
      // Self-heal DB on startup (idempotent)
      initDatabase(cfg.db_path, findSchemaPath());

      std::filesystem::create_directories(std::filesystem::path(cfg.scratch_dir) / "metadata");
      std::filesystem::create_directories(cfg.debug_dir);

      // Construct services
      EventStore eventStore(cfg.db_path);
      EventSink events(eventStore);
      std::unique_ptr<ObjectStore> store = makeStore(cfg);
      TransferManager transfer(*store, cfg.transfer);
      SessionRegistry registry(cfg.scratch_dir);
      ImportReader importer(transfer);
      RemoteArchiveFetcher fetcher(*store, cfg.transfer.import_bucket,
                                   cfg.transfer.store_domain, cfg.scratch_dir);
      ArchiveService service(registry, transfer, importer, fetcher, events, cfg.debug_dir);

      run_http_server(service, "0.0.0.0", cfg.port, cfg.scratch_dir);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
