#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>

namespace switchyard {

// ASCII only case folding: bytes outside 'A'-'Z' are returned unchanged.
constexpr char ToLowerAscii(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

// Compares two strings ignoring ASCII case, as required for method tokens and header names.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  return lhs.size() == rhs.size() &&
         std::ranges::equal(lhs, rhs, [](char lhsCh, char rhsCh) { return ToLowerAscii(lhsCh) == ToLowerAscii(rhsCh); });
}

namespace detail {

// RFC 9110 §5.6.2: tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
//                          "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
inline constexpr std::array<bool, 256> kTokenChars = []() {
  std::array<bool, 256> table{};
  for (std::size_t ch = '0'; ch <= '9'; ++ch) {
    table[ch] = true;
  }
  for (std::size_t ch = 'a'; ch <= 'z'; ++ch) {
    table[ch] = true;
    table[ch - ('a' - 'A')] = true;
  }
  for (char ch : std::string_view("!#$%&'*+-.^_`|~")) {
    table[static_cast<unsigned char>(ch)] = true;
  }
  return table;
}();

}  // namespace detail

constexpr bool IsTokenChar(char ch) noexcept { return detail::kTokenChars[static_cast<unsigned char>(ch)]; }

// A token is a non empty sequence of tchar.
constexpr bool IsToken(std::string_view str) noexcept {
  return !str.empty() && std::ranges::all_of(str, [](char ch) { return IsTokenChar(ch); });
}

// Strips leading and trailing OWS (SP and HTAB only).
constexpr std::string_view TrimOws(std::string_view str) noexcept {
  constexpr std::string_view kOws = " \t";
  const auto first = str.find_first_not_of(kOws);
  if (first == std::string_view::npos) {
    return {};
  }
  return str.substr(first, str.find_last_not_of(kOws) + 1U - first);
}

}  // namespace switchyard
