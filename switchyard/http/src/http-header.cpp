#include "switchyard/http-header.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string_view>

#include "switchyard/ascii.hpp"
#include "switchyard/http-constants.hpp"

namespace switchyard::http {

Header::Header(std::string_view name, std::string_view value) {
  if (!IsValidHeaderName(name)) {
    throw std::invalid_argument(std::format("HTTP header name is invalid: '{}'", name));
  }
  value = TrimOws(value);
  if (!IsValidHeaderValue(value)) {
    throw std::invalid_argument(std::format("HTTP header value is invalid for '{}'", name));
  }
  _colonPos = static_cast<uint32_t>(name.size());
  _data.reserve(name.size() + HeaderSep.size() + value.size());
  _data.append(name).append(HeaderSep).append(value);
}

bool IsValidHeaderName(std::string_view name) noexcept { return IsToken(name); }

bool IsValidHeaderValue(std::string_view value) noexcept {
  // HTAB, SP, visible ASCII or obs-text (0x80-0xFF). CR, LF, other controls and DEL are rejected.
  return std::ranges::all_of(value, [](char ch) {
    const auto byte = static_cast<unsigned char>(ch);
    return byte == '\t' || (byte >= ' ' && byte != 0x7F);
  });
}

}  // namespace switchyard::http
