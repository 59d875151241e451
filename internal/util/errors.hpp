#pragma once

#include <stdexcept>
#include <string>

namespace pageforge::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed or missing caller input. Raised before any work begins.
class ValidationFailure : public std::runtime_error {
 public:
  explicit ValidationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Local file or external process failure.
class IOFailure : public std::runtime_error {
 public:
  explicit IOFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The object store rejected a read or write.
class RemoteFailure : public std::runtime_error {
 public:
  explicit RemoteFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace pageforge::util
