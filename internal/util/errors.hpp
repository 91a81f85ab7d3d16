#pragma once

#include <stdexcept>
#include <string>

namespace mirrorwatch::util {

/*
  Central error types.

  Thrown by startup code and the read API; translated later to gRPC status
  codes. Scanner loops never let these escape a single host's work.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Invalid or incomplete configuration. Fatal at startup only.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A repository call returned a non-OK result.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace mirrorwatch::util
