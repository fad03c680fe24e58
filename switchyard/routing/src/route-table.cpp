#include "switchyard/route-table.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include "switchyard/http-method.hpp"
#include "switchyard/path-params.hpp"
#include "switchyard/path-split.hpp"
#include "switchyard/route-entry.hpp"
#include "switchyard/vector.hpp"

namespace switchyard {

RouteTable::RouteTable(vector<RouteEntry> entries) : _nbEntries(entries.size()) {
  for (RouteEntry& entry : entries) {
    const BucketKey key{entry.pattern.method(), static_cast<uint32_t>(entry.pattern.size())};
    _buckets[key].push_back(std::move(entry));
  }
}

std::span<const RouteEntry> RouteTable::bucket(http::Method method, std::size_t nbSegments) const noexcept {
  const auto it = _buckets.find(BucketKey{method, static_cast<uint32_t>(nbSegments)});
  if (it == _buckets.end()) {
    return {};
  }
  return it->second;
}

const RouteEntry* RouteTable::find(http::Method method, std::string_view path, PathParams& captures) const {
  const auto components = SplitPathComponents(path);
  for (const RouteEntry& entry : bucket(method, components.size())) {
    if (entry.pattern.match(components, captures)) {
      return &entry;
    }
  }
  return nullptr;
}

http::MethodBmp RouteTable::allowedMethods(std::string_view path) const {
  const auto components = SplitPathComponents(path);
  http::MethodBmp methods = 0;
  http::ForEachMethod(http::kAllMethods, [&](http::Method method) {
    const auto candidates = bucket(method, components.size());
    if (std::ranges::any_of(candidates, [&](const RouteEntry& entry) { return entry.pattern.matches(components); })) {
      methods = methods | method;
    }
  });
  return methods;
}

}  // namespace switchyard
