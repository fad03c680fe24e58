#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "switchyard/http-constants.hpp"

namespace switchyard::http {

// Represents a single HTTP header field.
// The name and value are validated upon construction.
class Header {
 public:
  // Constructs a Header with the given name and value.
  // The value is trimmed.
  // Throws std::invalid_argument if the name or the value is invalid.
  Header(std::string_view name, std::string_view value);

  // Returns the header name.
  [[nodiscard]] std::string_view name() const noexcept { return {_data.data(), _colonPos}; }

  // Returns the header value.
  [[nodiscard]] std::string_view value() const noexcept {
    return std::string_view(_data).substr(_colonPos + HeaderSep.size());
  }

  // Returns the raw header as "Name: Value".
  [[nodiscard]] std::string_view raw() const noexcept { return _data; }

  bool operator==(const Header&) const noexcept = default;

 private:
  std::string _data;
  uint32_t _colonPos{};
};

// Validates that a header name consists only of tchar characters as per RFC 7230 §3.2.6.
bool IsValidHeaderName(std::string_view name) noexcept;

// Validates that a header value does not contain any invalid characters.
// Specifically, it must not contain CR or LF characters, but may contain HTAB and visible ASCII characters.
// The empty value is allowed.
bool IsValidHeaderValue(std::string_view value) noexcept;

}  // namespace switchyard::http
