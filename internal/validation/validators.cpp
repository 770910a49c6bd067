#include "internal/validation/validators.hpp"

#include <cmath>
#include <optional>
#include <vector>

#include "internal/util/errors.hpp"

namespace stepdb::validation {

namespace {

// Decodes UTF-8, rejecting overlong forms, surrogates and truncation.
std::optional<std::vector<char32_t>> DecodeUtf8(std::string_view text) {
  std::vector<char32_t> out;
  out.reserve(text.size());

  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);

    std::size_t len;
    char32_t    cp;
    char32_t    min;
    if (lead < 0x80) {
      out.push_back(lead);
      ++i;
      continue;
    } else if ((lead & 0xE0) == 0xC0) {
      len = 2;
      cp  = lead & 0x1F;
      min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      len = 3;
      cp  = lead & 0x0F;
      min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      len = 4;
      cp  = lead & 0x07;
      min = 0x10000;
    } else {
      return std::nullopt;
    }

    if (i + len > text.size()) return std::nullopt;
    for (std::size_t k = 1; k < len; ++k) {
      const auto cont = static_cast<unsigned char>(text[i + k]);
      if ((cont & 0xC0) != 0x80) return std::nullopt;
      cp = (cp << 6) | (cont & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return std::nullopt;
    out.push_back(cp);
    i += len;
  }
  return out;
}

bool IsAsciiLetter(char32_t cp) {
  return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
}

bool IsIdentifierStart(char32_t cp) {
  return IsAsciiLetter(cp) || cp == U'_' || cp == U'-' || cp >= 0xA0;
}

bool IsIdentifierPart(char32_t cp) {
  return IsIdentifierStart(cp) || (cp >= U'0' && cp <= U'9');
}

[[noreturn]] void Fail(std::string_view field, std::string_view value, const std::string& expected) {
  throw util::ValidationError(std::string(field) + " ('" + std::string(value) + "') is not " + expected);
}

} // namespace

void StringValidator::Validate(std::string_view field, std::string_view value) const {
  if (!DecodeUtf8(value)) {
    Fail(field, value, "a UTF-8 string");
  }
}

void IdentifierValidator::Validate(std::string_view field, std::string_view value) const {
  const std::string expected = "an identifier of at most " + std::to_string(max_length_) + " characters";

  const auto code_points = DecodeUtf8(value);
  if (!code_points || code_points->empty() || code_points->size() > max_length_) {
    Fail(field, value, expected);
  }

  if (!IsIdentifierStart(code_points->front())) {
    Fail(field, value, expected);
  }
  for (std::size_t i = 1; i < code_points->size(); ++i) {
    if (!IsIdentifierPart((*code_points)[i])) {
      Fail(field, value, expected);
    }
  }
}

void IntValidator::Validate(std::string_view field, double value) const {
  // 2^63 is exactly representable; anything at or past it overflows int64
  constexpr double kLimit = 9223372036854775808.0;
  if (!std::isfinite(value) || std::trunc(value) != value || value < -kLimit || value >= kLimit) {
    throw util::ValidationError(std::string(field) + " (" + std::to_string(value) + ") is not an integer");
  }
}

} // namespace stepdb::validation
