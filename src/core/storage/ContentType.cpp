#include "ContentType.hpp"

namespace potlog {

namespace {

struct Signature {
  std::string_view magic;
  std::size_t offset;
  const char* type;
};

const Signature kSignatures[] = {
  {"\x89PNG\r\n\x1a\n", 0, "image/png"},
  {"\xff\xd8\xff", 0, "image/jpeg"},
  {"GIF87a", 0, "image/gif"},
  {"GIF89a", 0, "image/gif"},
  {"BM", 0, "image/bmp"},
  {std::string_view("\x00\x00\x01\x00", 4), 0, "image/x-icon"},
  {std::string_view("\x00\x00\x02\x00", 4), 0, "image/x-icon"},
  {"WEBPVP", 8, "image/webp"},
  {"%PDF-", 0, "application/pdf"},
  {"PK\x03\x04", 0, "application/zip"},
  {"\x1f\x8b\x08", 0, "application/x-gzip"},
};

bool matches(std::string_view data, const Signature& sig) {
  if (data.size() < sig.offset + sig.magic.size()) return false;
  return data.substr(sig.offset, sig.magic.size()) == sig.magic;
}

bool is_binary_byte(unsigned char c) {
  return c <= 0x08 || c == 0x0B || (c >= 0x0E && c <= 0x1A) || (c >= 0x1C && c <= 0x1F);
}

} // namespace

std::string sniffContentType(std::string_view data) {
  data = data.substr(0, 512);

  // RIFF container only counts as webp when the header says so
  for (const auto& sig : kSignatures) {
    if (sig.offset == 8 && !(data.size() >= 4 && data.substr(0, 4) == "RIFF")) continue;
    if (matches(data, sig)) return sig.type;
  }

  for (unsigned char c : data) {
    if (is_binary_byte(c)) return "application/octet-stream";
  }
  return "text/plain; charset=utf-8";
}

bool looksLikeImageType(std::string_view contentType) {
  return contentType.substr(0, 6) == "image/";
}

} // namespace potlog
