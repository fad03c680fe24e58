#pragma once

#include <exception>
#include <functional>

#include "switchyard/http-request.hpp"
#include "switchyard/http-response.hpp"
#include "switchyard/path-params.hpp"
#include "switchyard/request-task.hpp"

namespace switchyard {

// Coroutine-friendly route handler: receives the ordered wildcard captures and the inbound request,
// and produces the response asynchronously.
// The request is passed by reference: the transport keeps it alive until the returned task completes.
using RouteHandler = std::function<RequestTask<HttpResponse>(PathParams, HttpRequest&)>;

// Produces the response for a request that matched no registered route.
using NotFoundHandler = std::function<HttpResponse(const HttpRequest&)>;

// Converts a failure raised by a route handler into a response.
using InternalErrorHandler = std::function<HttpResponse(const std::exception&)>;

}  // namespace switchyard
