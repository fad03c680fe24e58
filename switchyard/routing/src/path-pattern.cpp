#include "switchyard/path-pattern.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "switchyard/http-method.hpp"
#include "switchyard/path-params.hpp"
#include "switchyard/path-split.hpp"

namespace switchyard {

PathSegment PathSegment::FromToken(std::string_view token) {
  if (token.empty()) {
    throw std::invalid_argument("Path pattern token cannot be empty");
  }
  if (token.find('/') != std::string_view::npos) {
    throw std::invalid_argument(std::format("Path pattern token '{}' cannot contain '/'", token));
  }
  PathSegment segment;
  if (token != kWildcardToken) {
    segment._literal = token;
  }
  return segment;
}

PathPattern::PathPattern(http::Method method, std::initializer_list<std::string_view> tokens)
    : PathPattern(method, std::span<const std::string_view>(tokens.begin(), tokens.size())) {}

PathPattern::PathPattern(http::Method method, std::span<const std::string_view> tokens) : _method(method) {
  _segments.reserve(tokens.size());
  for (std::string_view token : tokens) {
    appendToken(token);
  }
}

PathPattern PathPattern::Parse(http::Method method, std::string_view path) {
  const auto components = SplitPathComponents(path);
  return {method, std::span<const std::string_view>(components)};
}

void PathPattern::appendToken(std::string_view token) {
  PathSegment& segment = _segments.emplace_back(PathSegment::FromToken(token));
  if (segment.isWildcard()) {
    ++_nbWildcards;
  }
}

bool PathPattern::matches(std::span<const std::string_view> components) const noexcept {
  if (components.size() != _segments.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < components.size(); ++pos) {
    const PathSegment& segment = _segments[pos];
    if (!segment.isWildcard() && segment.literal() != components[pos]) {
      return false;
    }
  }
  return true;
}

bool PathPattern::match(std::span<const std::string_view> components, PathParams& captures) const {
  if (!matches(components)) {
    return false;
  }
  if (_nbWildcards != 0) {
    captures.reserve(captures.size() + _nbWildcards);
    for (std::size_t pos = 0; pos < components.size(); ++pos) {
      if (_segments[pos].isWildcard()) {
        captures.emplace_back(components[pos]);
      }
    }
  }
  return true;
}

std::string PathPattern::toString() const {
  if (_segments.empty()) {
    return "/";
  }
  std::string ret;
  for (const PathSegment& segment : _segments) {
    ret.push_back('/');
    ret.append(segment.isWildcard() ? kWildcardToken : segment.literal());
  }
  return ret;
}

bool PathPattern::operator==(const PathPattern& other) const noexcept {
  return _method == other._method && std::ranges::equal(_segments, other._segments);
}

}  // namespace switchyard
