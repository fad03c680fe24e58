#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <type_traits>

namespace switchyard::http {

// Request methods known to the router. Each method is a distinct bit so that sets of methods fit in a MethodBmp.
enum class Method : uint16_t {
  GET = 1 << 0,
  HEAD = 1 << 1,
  POST = 1 << 2,
  PUT = 1 << 3,
  DELETE = 1 << 4,
  CONNECT = 1 << 5,
  OPTIONS = 1 << 6,
  TRACE = 1 << 7,
  PATCH = 1 << 8
};

// Position of a method bit, in [0, kNbMethods).
using MethodIdx = std::underlying_type_t<Method>;

inline constexpr MethodIdx kNbMethods = 9;

// Set of methods.
using MethodBmp = uint16_t;

inline constexpr MethodBmp kAllMethods = static_cast<MethodBmp>((1U << kNbMethods) - 1U);

static_assert(kNbMethods <= std::numeric_limits<MethodBmp>::digits, "MethodBmp cannot hold all methods");

constexpr MethodBmp ToMethodBmp(Method method) noexcept { return static_cast<MethodBmp>(method); }

constexpr MethodBmp operator|(Method lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(ToMethodBmp(lhs) | ToMethodBmp(rhs));
}

constexpr MethodBmp operator|(MethodBmp lhs, Method rhs) noexcept {
  return static_cast<MethodBmp>(lhs | ToMethodBmp(rhs));
}

constexpr MethodBmp operator|(Method lhs, MethodBmp rhs) noexcept {
  return static_cast<MethodBmp>(ToMethodBmp(lhs) | rhs);
}

constexpr MethodIdx MethodToIdx(Method method) noexcept {
  return static_cast<MethodIdx>(std::countr_zero(ToMethodBmp(method)));
}

// Prerequisite: methodIdx < kNbMethods
constexpr Method MethodFromIdx(MethodIdx methodIdx) noexcept { return static_cast<Method>(1U << methodIdx); }

constexpr bool IsMethodSet(MethodBmp methods, Method method) noexcept { return (methods & ToMethodBmp(method)) != 0; }

constexpr bool IsMethodIdxSet(MethodBmp methods, MethodIdx methodIdx) noexcept {
  return IsMethodSet(methods, MethodFromIdx(methodIdx));
}

// Calls 'func(Method)' for each method of 'methods', in ascending bit order.
template <class Func>
constexpr void ForEachMethod(MethodBmp methods, Func&& func) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (IsMethodIdxSet(methods, methodIdx)) {
      func(MethodFromIdx(methodIdx));
    }
  }
}

// Canonical (upper case) method tokens, indexed by MethodIdx.
inline constexpr std::array<std::string_view, kNbMethods> kMethodStrings{"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                                        "CONNECT", "OPTIONS", "TRACE", "PATCH"};

constexpr std::string_view MethodToStr(Method method) noexcept { return kMethodStrings[MethodToIdx(method)]; }

// Sum of the lengths of all method tokens.
inline constexpr std::size_t kAllMethodsStrLen = []() {
  std::size_t len = 0;
  for (std::string_view methodStr : kMethodStrings) {
    len += methodStr.size();
  }
  return len;
}();

}  // namespace switchyard::http
