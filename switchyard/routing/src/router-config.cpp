#include "switchyard/router-config.hpp"

#include <exception>
#include <utility>

#include "switchyard/http-request.hpp"
#include "switchyard/http-response.hpp"
#include "switchyard/http-status-code.hpp"

namespace switchyard {

RouterConfig& RouterConfig::withDuplicatePolicy(DuplicatePolicy policy) {
  duplicatePolicy = policy;
  return *this;
}

RouterConfig& RouterConfig::withNotFoundHandler(NotFoundHandler handler) {
  notFoundHandler = std::move(handler);
  return *this;
}

RouterConfig& RouterConfig::withInternalErrorHandler(InternalErrorHandler handler) {
  internalErrorHandler = std::move(handler);
  return *this;
}

HttpResponse DefaultNotFoundHandler([[maybe_unused]] const HttpRequest& request) {
  return HttpResponse(http::StatusCodeNotFound);
}

HttpResponse DefaultInternalErrorHandler(const std::exception& ex) {
  return HttpResponse(http::StatusCodeInternalServerError).body(ex.what());
}

}  // namespace switchyard
