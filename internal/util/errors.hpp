#pragma once

#include <stdexcept>
#include <string>

namespace taskengine::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class InvalidRange : public std::runtime_error {
 public:
  explicit InvalidRange(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace taskengine::util
