#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace stepdb::validation {

/*
  Shape checks applied to caller-supplied column values.

  Every Validate() throws util::ValidationError naming the field and the
  offending value; nothing is returned on success.
*/

// Well-formed UTF-8 text.
class StringValidator {
 public:
  void Validate(std::string_view field, std::string_view value) const;
};

// Bounded identifier: 1..max_length code points, a letter, '_', '-' or
// non-ASCII code point first, digits also allowed after that.
class IdentifierValidator {
 public:
  explicit IdentifierValidator(std::size_t max_length) : max_length_(max_length) {
  }

  void Validate(std::string_view field, std::string_view value) const;

  std::size_t MaxLength() const {
    return max_length_;
  }

 private:
  std::size_t max_length_;
};

// Any integer is accepted; negative ids are simply unknown steps.
class IntValidator {
 public:
  void Validate(std::string_view, std::int64_t) const {
  }

  // Numbers decoded from text must be whole and fit in int64.
  void Validate(std::string_view field, double value) const;
};

} // namespace stepdb::validation
