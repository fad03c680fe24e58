#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string_view>
#include <utility>

#include "switchyard/http-method.hpp"
#include "switchyard/path-pattern.hpp"
#include "switchyard/route-entry.hpp"
#include "switchyard/route-handler.hpp"
#include "switchyard/router-config.hpp"
#include "switchyard/router.hpp"
#include "switchyard/vector.hpp"

namespace switchyard {

// Accumulates routes, then compiles them into an immutable Router.
//
// Registration order matters: when several patterns of the same method and length match a path, the one
// registered first wins, regardless of how specific the others are.
//
// Usage:
//   Router router = RouterBuilder()
//                       .registerRoute(http::Method::GET, "/", IndexHandler)
//                       .registerRoute(http::Method::GET, {"users", "_"}, UserHandler)
//                       .registerRoute(http::Method::POST, "/users/_/posts", NewPostHandler)
//                       .build();
//
// Registration is expected to happen once, from a single thread, before serving requests.
// Malformed registrations throw std::invalid_argument so that they abort startup.
class RouterBuilder {
 public:
  // Creates an empty builder with the default RouterConfig.
  RouterBuilder() = default;

  explicit RouterBuilder(RouterConfig config);

  // Register a handler for a pattern given as an ordered list of tokens.
  // kWildcardToken ("_") denotes a wildcard, any other token a literal.
  RouterBuilder& registerRoute(http::Method method, std::initializer_list<std::string_view> tokens,
                               RouteHandler handler) &;

  RouterBuilder&& registerRoute(http::Method method, std::initializer_list<std::string_view> tokens,
                                RouteHandler handler) && {
    return std::move(registerRoute(method, tokens, std::move(handler)));
  }

  // Register a handler for a pattern written in slash notation, e.g. "/foo/_/bar".
  // See PathPattern::Parse.
  RouterBuilder& registerRoute(http::Method method, std::string_view path, RouteHandler handler) &;

  RouterBuilder&& registerRoute(http::Method method, std::string_view path, RouteHandler handler) && {
    return std::move(registerRoute(method, path, std::move(handler)));
  }

  // Register the same handler for each method set in 'methods', in ascending method order.
  RouterBuilder& registerRoute(http::MethodBmp methods, std::string_view path, RouteHandler handler) &;

  RouterBuilder&& registerRoute(http::MethodBmp methods, std::string_view path, RouteHandler handler) && {
    return std::move(registerRoute(methods, path, std::move(handler)));
  }

  // Register a handler for a prebuilt pattern.
  RouterBuilder& registerRoute(PathPattern pattern, RouteHandler handler) &;

  RouterBuilder&& registerRoute(PathPattern pattern, RouteHandler handler) && {
    return std::move(registerRoute(std::move(pattern), std::move(handler)));
  }

  // Number of registered routes so far.
  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  // Compiles the accumulated routes into a Router, consuming the builder.
  [[nodiscard]] Router build() &&;

 private:
  void addEntry(PathPattern pattern, std::shared_ptr<const RouteHandler> handler);

  static std::shared_ptr<const RouteHandler> ShareHandler(RouteHandler handler);

  RouterConfig _config;
  vector<RouteEntry> _entries;
};

}  // namespace switchyard
