#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

#include "switchyard/http-method.hpp"
#include "switchyard/path-params.hpp"
#include "switchyard/vector.hpp"

namespace switchyard {

// Token designating a wildcard segment in a pattern.
inline constexpr std::string_view kWildcardToken = "_";

// One segment of a path pattern: either literal text, or a wildcard capturing any single path component.
class PathSegment {
 public:
  enum class Kind : std::uint8_t { Literal, Wildcard };

  // Classifies a token: kWildcardToken yields a wildcard, any other text a literal.
  // Throws std::invalid_argument if the token is empty or contains a '/'.
  static PathSegment FromToken(std::string_view token);

  static PathSegment Wildcard() noexcept { return {}; }

  [[nodiscard]] Kind kind() const noexcept { return _literal.empty() ? Kind::Wildcard : Kind::Literal; }

  [[nodiscard]] bool isWildcard() const noexcept { return _literal.empty(); }

  // The literal text, empty for a wildcard.
  [[nodiscard]] std::string_view literal() const noexcept { return _literal; }

  bool operator==(const PathSegment&) const noexcept = default;

 private:
  PathSegment() noexcept = default;

  std::string _literal;  // non empty when Kind::Literal
};

// Immutable, fixed-length sequence of segments bound to a HTTP method.
//
// Two patterns are equal if they have the same method and the same segments (same kind, and same text for
// literals). A pattern without segments is the root pattern, matching only the path with zero components.
class PathPattern {
 public:
  // Creates the root pattern for given method.
  explicit PathPattern(http::Method method) noexcept : _method(method) {}

  // Creates a pattern from an ordered list of tokens, each classified by PathSegment::FromToken.
  // Examples:
  //   PathPattern(http::Method::GET, {})                    -> /
  //   PathPattern(http::Method::POST, {"foo", "_", "bar"})  -> /foo/_/bar
  // Throws std::invalid_argument on an empty token or a token containing '/'.
  PathPattern(http::Method method, std::initializer_list<std::string_view> tokens);

  PathPattern(http::Method method, std::span<const std::string_view> tokens);

  // Parses a slash-separated pattern such as "/foo/_/bar".
  // Empty components (leading, trailing or repeated slashes) are ignored, so "/" and "" give the root pattern.
  static PathPattern Parse(http::Method method, std::string_view path);

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Number of segments.
  [[nodiscard]] std::size_t size() const noexcept { return _segments.size(); }

  [[nodiscard]] bool isRoot() const noexcept { return _segments.empty(); }

  // Prerequisite: pos < size()
  [[nodiscard]] const PathSegment& operator[](std::size_t pos) const noexcept { return _segments[pos]; }

  [[nodiscard]] std::span<const PathSegment> segments() const noexcept { return _segments; }

  [[nodiscard]] uint32_t nbWildcards() const noexcept { return _nbWildcards; }

  // Tells whether the given path components satisfy this pattern, ignoring the method.
  // Literal segments compare byte-wise (case-sensitive), wildcards accept any component.
  [[nodiscard]] bool matches(std::span<const std::string_view> components) const noexcept;

  // Same as matches(), and on success appends the components at wildcard positions to 'captures',
  // in left-to-right order. 'captures' is left untouched on failure.
  bool match(std::span<const std::string_view> components, PathParams& captures) const;

  // Renders the pattern in slash notation, e.g. "/foo/_/bar". The root pattern renders as "/".
  [[nodiscard]] std::string toString() const;

  bool operator==(const PathPattern& other) const noexcept;

 private:
  void appendToken(std::string_view token);

  vector<PathSegment> _segments;
  uint32_t _nbWildcards{};
  http::Method _method;
};

}  // namespace switchyard
