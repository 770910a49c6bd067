#pragma once

#include <stdexcept>
#include <string>

namespace stepdb::util {

/*
  Central error types.

  Absence is never an error: lookups return std::nullopt and mutators
  silently ignore unknown step ids.
*/

// A caller-supplied value violates a shape constraint.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The call itself is malformed, e.g. a lookup without any key.
class InvalidArguments : public std::runtime_error {
 public:
  explicit InvalidArguments(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A stored column cannot be decoded.
class CorruptRecord : public std::runtime_error {
 public:
  explicit CorruptRecord(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace stepdb::util
