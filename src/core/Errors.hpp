#pragma once
#include <stdexcept>
#include <string>

namespace potlog {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Missing/malformed caller input, archive without metadata, bad import host.
class ValidationError : public Error {
public:
  using Error::Error;
};

// Session already finished, or no session for the device.
class StateError : public Error {
public:
  using Error::Error;
};

// Local file or stream failure.
class IOError : public Error {
public:
  using Error::Error;
};

// Remote content store failure. what() is safe to show callers,
// diagnostic() carries the backend detail for logs.
class StorageError : public Error {
public:
  StorageError(const std::string& message, std::string diagnostic)
    : Error(message), diagnostic_(std::move(diagnostic)) {}
  explicit StorageError(const std::string& message)
    : Error(message) {}

  const std::string& diagnostic() const { return diagnostic_; }

private:
  std::string diagnostic_;
};

} // namespace potlog
