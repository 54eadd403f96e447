#pragma once
#include <cstdio>
#include <exception>
#include <map>
#include <memory>
#include <string>

#include "core/io/ByteSource.hpp"

namespace potlog {

// One request's form fields plus the uploaded file, if any.
struct SpooledForm {
  std::map<std::string, std::string> fields;
  std::string filename;
  std::string content_type;
  std::unique_ptr<FileSource> file;   // null when no file part was sent

  // Empty when absent.
  std::string field(const std::string& name) const;
};

// Collects a multipart body part by part as it arrives. Text parts are kept
// in memory; the part named fileField is written straight to a scratch file
// so uploads of any size never sit in memory whole.
//
// beginPart/append never throw: they return false to stop the transfer and
// finish() rethrows the recorded failure.
class UploadSpool {
public:
  UploadSpool(std::string scratchDir, std::string fileField);

  UploadSpool(const UploadSpool&) = delete;
  UploadSpool& operator=(const UploadSpool&) = delete;

  bool beginPart(const std::string& name, const std::string& filename,
                 const std::string& contentType);
  bool append(const char* data, std::size_t len);

  // Throws ValidationError or IOError for a failed transfer. The spooled
  // file comes back rewound and is removed when released.
  SpooledForm finish();

  static constexpr std::size_t kMaxFieldBytes = 32 * 1024 * 1024;

private:
  void openSpoolFile();

  std::string scratchDir_;
  std::string fileField_;
  SpooledForm form_;
  std::FILE* out_ = nullptr;          // owned by form_.file
  std::string* text_ = nullptr;       // field receiving text data
  bool inFile_ = false;
  std::exception_ptr error_;
};

} // namespace potlog
