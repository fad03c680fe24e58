#include "switchyard/router.hpp"

#include <coroutine>
#include <exception>
#include <memory>
#include <string_view>
#include <utility>

#include "switchyard/http-method-parse.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response.hpp"
#include "switchyard/request-task.hpp"
#include "switchyard/route-handler.hpp"
#include "switchyard/route-table.hpp"
#include "switchyard/router-config.hpp"

namespace switchyard {

namespace {

RequestTask<HttpResponse> ReadyResponse(HttpResponse response) { co_return std::move(response); }

// Drives the handler task, forwarding each of its suspensions to our own caller, then converts a
// std::exception based failure into the response of 'onError'.
RequestTask<HttpResponse> RecoverHandlerFailure(RequestTask<HttpResponse> task, InternalErrorHandler onError) {
  task.resume();
  while (!task.done()) {
    co_await std::suspend_always{};
    task.resume();
  }

  HttpResponse response;
  try {
    response = task.runSynchronously();
  } catch (const std::exception& ex) {
    response = onError(ex);
  }
  co_return response;
}

}  // namespace

Router::Router() : Router(RouteTable{}, RouterConfig{}) {}

Router::Router(RouteTable routeTable, RouterConfig config)
    : _pRouteTable(std::make_shared<const RouteTable>(std::move(routeTable))),
      _pConfig(std::make_shared<const RouterConfig>(std::move(config))) {}

Router::RoutingResult Router::match(http::Method method, std::string_view path) const {
  RoutingResult result;
  result.pEntry = _pRouteTable->find(method, path, result.pathParams);
  return result;
}

RequestTask<HttpResponse> Router::dispatch(http::Method method, std::string_view path, HttpRequest& request) const {
  RoutingResult result = match(method, path);
  if (!result.hasHandler()) {
    return notFound(request);
  }

  const RouteHandler& handler = result.handler();
  if (!_pConfig->internalErrorHandler) {
    return handler(std::move(result.pathParams), request);
  }

  RequestTask<HttpResponse> task;
  try {
    task = handler(std::move(result.pathParams), request);
  } catch (const std::exception& ex) {
    return ReadyResponse(_pConfig->internalErrorHandler(ex));
  }
  return RecoverHandlerFailure(std::move(task), _pConfig->internalErrorHandler);
}

RequestTask<HttpResponse> Router::dispatch(std::string_view method, std::string_view path,
                                           HttpRequest& request) const {
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (!optMethod) {
    return notFound(request);
  }
  return dispatch(*optMethod, path, request);
}

http::MethodBmp Router::allowedMethods(std::string_view path) const { return _pRouteTable->allowedMethods(path); }

RequestTask<HttpResponse> Router::notFound(HttpRequest& request) const {
  if (_pConfig->notFoundHandler) {
    return ReadyResponse(_pConfig->notFoundHandler(request));
  }
  return ReadyResponse(DefaultNotFoundHandler(request));
}

}  // namespace switchyard
