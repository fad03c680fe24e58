#pragma once

#include <cstdint>
#include <exception>

#include "switchyard/http-request.hpp"
#include "switchyard/http-response.hpp"
#include "switchyard/route-handler.hpp"

namespace switchyard {

struct RouterConfig {
  enum class DuplicatePolicy : std::int8_t { Shadow, Reject };

  // Behavior when a registered pattern is identical (same method and segments) to an earlier one.
  //   Shadow: keep both; the earlier registration always wins and the later one is never reachable.
  //           A warning is logged.
  //   Reject: registration throws std::invalid_argument.
  // Default: Shadow
  DuplicatePolicy duplicatePolicy{DuplicatePolicy::Shadow};

  // Produces the response of requests matching no route.
  // If empty, DefaultNotFoundHandler is used.
  NotFoundHandler notFoundHandler;

  // If set, std::exception based failures raised by route handlers (synchronously or from within their
  // coroutine) are converted into the response it returns.
  // If empty (the default), handler failures are propagated unchanged to the consumer of the dispatched task.
  InternalErrorHandler internalErrorHandler;

  RouterConfig& withDuplicatePolicy(DuplicatePolicy policy);

  RouterConfig& withNotFoundHandler(NotFoundHandler handler);

  RouterConfig& withInternalErrorHandler(InternalErrorHandler handler);
};

// Empty 404 Not Found response.
HttpResponse DefaultNotFoundHandler(const HttpRequest& request);

// 500 Internal Server Error response whose text body is the exception message.
HttpResponse DefaultInternalErrorHandler(const std::exception& ex);

}  // namespace switchyard
