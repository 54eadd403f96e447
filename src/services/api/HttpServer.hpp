#pragma once
#include <string>

namespace potlog {
  class ArchiveService;

  // Start a blocking HTTP server exposing the image and export routes.
  // Uploaded files are spooled under uploadDir while a request runs.
  void run_http_server(ArchiveService& service,
                       const std::string& host,
                       int port,
                       const std::string& uploadDir);
}
