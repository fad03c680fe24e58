#include "switchyard/router-builder.hpp"

#include <algorithm>
#include <format>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "switchyard/http-method.hpp"
#include "switchyard/log.hpp"
#include "switchyard/path-pattern.hpp"
#include "switchyard/route-entry.hpp"
#include "switchyard/route-handler.hpp"
#include "switchyard/route-table.hpp"
#include "switchyard/router-config.hpp"
#include "switchyard/router.hpp"

namespace switchyard {

RouterBuilder::RouterBuilder(RouterConfig config) : _config(std::move(config)) {}

std::shared_ptr<const RouteHandler> RouterBuilder::ShareHandler(RouteHandler handler) {
  if (!handler) {
    throw std::invalid_argument("registerRoute requires a handler");
  }
  return std::make_shared<const RouteHandler>(std::move(handler));
}

RouterBuilder& RouterBuilder::registerRoute(http::Method method, std::initializer_list<std::string_view> tokens,
                                            RouteHandler handler) & {
  auto pHandler = ShareHandler(std::move(handler));
  addEntry(PathPattern(method, tokens), std::move(pHandler));
  return *this;
}

RouterBuilder& RouterBuilder::registerRoute(http::Method method, std::string_view path, RouteHandler handler) & {
  auto pHandler = ShareHandler(std::move(handler));
  addEntry(PathPattern::Parse(method, path), std::move(pHandler));
  return *this;
}

RouterBuilder& RouterBuilder::registerRoute(http::MethodBmp methods, std::string_view path, RouteHandler handler) & {
  if (methods == 0) {
    throw std::invalid_argument(std::format("registerRoute for '{}' requires at least one method", path));
  }
  auto pHandler = ShareHandler(std::move(handler));
  http::ForEachMethod(methods, [&](http::Method method) { addEntry(PathPattern::Parse(method, path), pHandler); });
  return *this;
}

RouterBuilder& RouterBuilder::registerRoute(PathPattern pattern, RouteHandler handler) & {
  auto pHandler = ShareHandler(std::move(handler));
  addEntry(std::move(pattern), std::move(pHandler));
  return *this;
}

void RouterBuilder::addEntry(PathPattern pattern, std::shared_ptr<const RouteHandler> handler) {
  const auto methodStr = http::MethodToStr(pattern.method());
  const bool isDuplicate =
      std::ranges::any_of(_entries, [&pattern](const RouteEntry& entry) { return entry.pattern == pattern; });
  if (isDuplicate) {
    if (_config.duplicatePolicy == RouterConfig::DuplicatePolicy::Reject) {
      throw std::invalid_argument(std::format("Route {} {} is already registered", methodStr, pattern.toString()));
    }
    log::warn("Route {} {} is shadowed by an earlier registration and will never be matched", methodStr,
              pattern.toString());
  }

  log::debug("Registered route {} {}", methodStr, pattern.toString());
  _entries.push_back(RouteEntry{std::move(pattern), std::move(handler)});
}

Router RouterBuilder::build() && {
  RouteTable routeTable(std::move(_entries));
  log::info("Router built with {} route(s) in {} bucket(s)", routeTable.size(), routeTable.bucketCount());
  return {std::move(routeTable), std::move(_config)};
}

}  // namespace switchyard
