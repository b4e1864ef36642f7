#pragma once

#include <stdexcept>
#include <string>

namespace keysync::util {

/*
  Central error types.

  Every one of these is terminal for a sync run. main() classifies them
  with ErrorKind() for the final log line.
*/

// address could not be parsed or has too few path segments
class InvalidAddress : public std::runtime_error {
 public:
  explicit InvalidAddress(const std::string& msg) : std::runtime_error(msg) {
  }
};

// transport failure (or HTTP error status) on a remote call
class FetchFailed : public std::runtime_error {
 public:
  explicit FetchFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// remote payload is not JSON or lacks the revision id
class MalformedResponse : public std::runtime_error {
 public:
  explicit MalformedResponse(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace keysync::util
