#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

#include "core/Errors.hpp"
#include "core/archive/ArchiveReader.hpp"
#include "core/io/ByteSource.hpp"
#include "services/ArchiveService.hpp"
#include "services/api/UploadSpool.hpp"

using nlohmann::json;

namespace potlog {

// -------- helpers --------

static const char* kOk = R"({"status": "ok"})";

// Field from a urlencoded body, the query string, or a multipart text part.
static std::string form_value(const httplib::Request& req, const char* k) {
  if (req.has_param(k)) return req.get_param_value(k);
  if (req.is_multipart_form_data() && req.has_file(k)) return req.get_file_value(k).content;
  return {};
}

// Reads the body as it arrives. A multipart part named fileField is spooled
// to uploadDir; urlencoded bodies are bounded like any text field.
static SpooledForm read_form(const httplib::Request& req, const httplib::ContentReader& reader,
                             const std::string& uploadDir, const char* fileField) {
  SpooledForm form;
  bool complete = false;
  if (req.is_multipart_form_data()) {
    UploadSpool spool(uploadDir, fileField);
    complete = reader(
      [&](const httplib::MultipartFormData& part) {
        return spool.beginPart(part.name, part.filename, part.content_type);
      },
      [&](const char* data, size_t len) { return spool.append(data, len); });
    form = spool.finish();
  } else {
    std::string body;
    bool tooLarge = false;
    complete = reader([&](const char* data, size_t len) {
      if (body.size() + len > UploadSpool::kMaxFieldBytes) {
        tooLarge = true;
        return false;
      }
      body.append(data, len);
      return true;
    });
    if (tooLarge) throw ValidationError("Request body too large");
    httplib::Params params;
    httplib::detail::parse_query_text(body, params);
    for (const auto& [k, v] : params) form.fields.emplace(k, v);
  }
  if (!complete) throw IOError("upload interrupted");

  // query-string values fill in what the body left out
  for (const auto& [k, v] : req.params) form.fields.emplace(k, v);
  return form;
}

static void write_error(httplib::Response& res, int status, const std::string& message) {
  res.status = status;
  res.set_content(json({{"status", "error"}, {"message", message}}).dump(), "application/json");
}

// Runs fn and turns any failure into a JSON error response.
template <typename Fn>
static void guarded(ArchiveService& svc, const std::string& deviceId,
                    httplib::Response& res, Fn&& fn) {
  std::string message;
  try {
    fn();
    return;
  } catch (const ValidationError& e) {
    message = e.what();
    spdlog::warn("Error: {}", message);
    write_error(res, 400, message);
  } catch (const StateError& e) {
    message = e.what();
    spdlog::warn("Error: {}", message);
    write_error(res, 409, message);
  } catch (const StorageError& e) {
    message = e.what();
    spdlog::error("Error: {} ({})", message, e.diagnostic());
    write_error(res, 502, "storage backend failure");
  } catch (const IOError& e) {
    message = e.what();
    spdlog::error("Error: {}", message);
    write_error(res, 500, message);
  } catch (const std::exception& e) {
    message = e.what();
    spdlog::error("Error: {}", message);
    write_error(res, 500, "internal error");
  }
  svc.recordError(deviceId, message);
}

// -------- server --------

void run_http_server(ArchiveService& svc, const std::string& host, int port,
                     const std::string& uploadDir) {
  httplib::Server svr;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /pottery-log-images/upload   deviceId, image (file)
  svr.Post("/pottery-log-images/upload",
           [&](const httplib::Request& req, httplib::Response& res, const httplib::ContentReader& reader) {
    std::string deviceId;
    guarded(svc, deviceId, res, [&] {
      SpooledForm form = read_form(req, reader, uploadDir, "image");
      deviceId = form.field("deviceId");
      if (!form.file) throw ValidationError("Missing required field image");
      std::string uri = svc.uploadImage(deviceId, *form.file, form.filename, form.content_type);
      res.set_content(json({{"status", "ok"}, {"uri", uri}}).dump(), "application/json");
    });
  });

  // POST /pottery-log-images/delete   uri
  svr.Post("/pottery-log-images/delete", [&](const httplib::Request& req, httplib::Response& res) {
    guarded(svc, "", res, [&] {
      svc.deleteImage(form_value(req, "uri"));
      res.set_content(kOk, "application/json");
    });
  });

  // POST /pottery-log/export   deviceId, metadata
  svr.Post("/pottery-log/export", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string deviceId = form_value(req, "deviceId");
    guarded(svc, deviceId, res, [&] {
      svc.startExport(deviceId, form_value(req, "metadata"));
      res.set_content(kOk, "application/json");
    });
  });

  // POST /pottery-log/export-image   deviceId, image (file)
  svr.Post("/pottery-log/export-image",
           [&](const httplib::Request& req, httplib::Response& res, const httplib::ContentReader& reader) {
    std::string deviceId;
    guarded(svc, deviceId, res, [&] {
      SpooledForm form = read_form(req, reader, uploadDir, "image");
      deviceId = form.field("deviceId");
      if (!form.file) throw ValidationError("Missing required field image");
      svc.exportImage(deviceId, *form.file, form.filename, form.content_type);
      res.set_content(kOk, "application/json");
    });
  });

  // POST /pottery-log/finish-export   deviceId
  svr.Post("/pottery-log/finish-export", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string deviceId = form_value(req, "deviceId");
    guarded(svc, deviceId, res, [&] {
      FinishedExport done = svc.finishExport(deviceId);
      res.set_content(json({{"status", "ok"}, {"uri", done.url}}).dump(), "application/json");
    });
  });

  // POST /pottery-log/import   deviceId, import (file) or importURL
  svr.Post("/pottery-log/import",
           [&](const httplib::Request& req, httplib::Response& res, const httplib::ContentReader& reader) {
    std::string deviceId;
    guarded(svc, deviceId, res, [&] {
      SpooledForm form = read_form(req, reader, uploadDir, "import");
      deviceId = form.field("deviceId");
      const std::string url = form.field("importURL");
      ImportResult result;
      if (!url.empty()) {
        result = svc.importFromUrl(deviceId, url);
      } else {
        if (!form.file) throw ValidationError("Missing required field import");
        auto archive = ArchiveReader::fromFile(form.file->path());
        result = svc.importArchive(deviceId, *archive);
      }
      json out = {
        {"status", "ok"},
        {"metadata", result.metadata},
        {"image_map", result.image_urls}
      };
      res.set_content(out.dump(), "application/json");
    });
  });

  // POST /pottery-log/debug   deviceId, data, name, appOwnership
  svr.Post("/pottery-log/debug", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string deviceId = form_value(req, "deviceId");
    guarded(svc, deviceId, res, [&] {
      svc.saveDebug(deviceId, form_value(req, "name"), form_value(req, "appOwnership"),
                    form_value(req, "data"));
      res.set_content(kOk, "application/json");
    });
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://{}:{}", host, port);
  if (!svr.listen(host, port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace potlog
