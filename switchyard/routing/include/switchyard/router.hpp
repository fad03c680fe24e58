#pragma once

#include <memory>
#include <string_view>

#include "switchyard/http-method.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response.hpp"
#include "switchyard/path-params.hpp"
#include "switchyard/request-task.hpp"
#include "switchyard/route-entry.hpp"
#include "switchyard/route-handler.hpp"
#include "switchyard/route-table.hpp"
#include "switchyard/router-config.hpp"

namespace switchyard {

class RouterBuilder;

// Immutable request router, produced by RouterBuilder::build().
//
// A Router is a cheap handle: copies share the same RouteTable. It has no mutating operation, so the same
// Router may serve any number of concurrent requests without synchronization.
//
// Lifetime: tasks returned by dispatch() refer to handlers owned by the route table. Keep at least one copy
// of the Router alive until all dispatched tasks have completed or been destroyed.
class Router {
 public:
  struct RoutingResult {
    [[nodiscard]] bool hasHandler() const noexcept { return pEntry != nullptr; }

    // Prerequisite: hasHandler()
    [[nodiscard]] const RouteHandler& handler() const noexcept { return *pEntry->handler; }

    // Prerequisite: hasHandler()
    [[nodiscard]] const PathPattern& pattern() const noexcept { return pEntry->pattern; }

    // The matched entry, nullptr if no route matched.
    const RouteEntry* pEntry{nullptr};

    // Values captured by the wildcards of the matched pattern, in left-to-right order.
    PathParams pathParams;
  };

  // Creates a Router without any route: every request gets the not-found response.
  Router();

  // Match the provided 'path' for 'method' against the route table.
  // Deterministic: the same (method, path) always yields the same entry and captures.
  [[nodiscard]] RoutingResult match(http::Method method, std::string_view path) const;

  // Route the request and return the task producing its response.
  //   - On match, the handler is invoked with the captures and the request, and its task is returned as is
  //     (unless an internal error handler is configured, see RouterConfig).
  //   - Otherwise, a task producing the not-found response is returned; no handler is invoked.
  // The router performs no logging, retry or request transformation.
  [[nodiscard]] RequestTask<HttpResponse> dispatch(http::Method method, std::string_view path,
                                                   HttpRequest& request) const;

  // Same as above with a textual method (case-insensitive). Unknown methods match no route.
  [[nodiscard]] RequestTask<HttpResponse> dispatch(std::string_view method, std::string_view path,
                                                   HttpRequest& request) const;

  // Route the request by its own method and path.
  [[nodiscard]] RequestTask<HttpResponse> dispatch(HttpRequest& request) const {
    return dispatch(request.method(), request.path(), request);
  }

  // Return a bitmap of the methods for which some route matches 'path'.
  // Transports may use it to tell apart 404 from 405 and to fill the 'Allow' header.
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const;

  [[nodiscard]] const RouteTable& routeTable() const noexcept { return *_pRouteTable; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return *_pConfig; }

 private:
  friend class RouterBuilder;

  Router(RouteTable routeTable, RouterConfig config);

  [[nodiscard]] RequestTask<HttpResponse> notFound(HttpRequest& request) const;

  std::shared_ptr<const RouteTable> _pRouteTable;
  std::shared_ptr<const RouterConfig> _pConfig;
};

}  // namespace switchyard
