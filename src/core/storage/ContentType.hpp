#pragma once
#include <string>
#include <string_view>

namespace potlog {

// Guesses a MIME type from the first bytes of a payload (at most 512 are
// considered). Unknown binary data is application/octet-stream.
std::string sniffContentType(std::string_view data);

bool looksLikeImageType(std::string_view contentType);

} // namespace potlog
