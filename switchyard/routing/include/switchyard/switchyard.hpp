// switchyard Umbrella Header
//
// Include this single header to pull in the public routing API:
//   - Registration and dispatch (RouterBuilder, Router, RouterConfig)
//   - Patterns and route table (PathPattern, PathSegment, RouteTable)
//   - Request / Response primitives handed over by the transport (HttpRequest, HttpResponse, RequestTask)
//   - HTTP enums & helpers (methods, status codes)
//
// Each re-exported header line is annotated with IWYU pragma: export so that symbols they provide are
// treated as satisfied when only this header is included.
//
// Usage Example:
//    #include <switchyard/switchyard.hpp>
//    using namespace switchyard;
//    RequestTask<HttpResponse> Hello(PathParams params, HttpRequest&) {
//      co_return HttpResponse(std::format("hello {}\n", params[0]));
//    }
//    Router router = RouterBuilder().registerRoute(http::Method::GET, "/hello/_", Hello).build();
//    // for each request decoded by the transport:
//    HttpResponse response = router.dispatch(request).runSynchronously();
#pragma once

// IWYU pragma: begin_exports
#include "switchyard/http-constants.hpp"
#include "switchyard/http-method-parse.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/path-params.hpp"
#include "switchyard/path-pattern.hpp"
#include "switchyard/request-task.hpp"
#include "switchyard/route-entry.hpp"
#include "switchyard/route-handler.hpp"
#include "switchyard/route-table.hpp"
#include "switchyard/router-builder.hpp"
#include "switchyard/router-config.hpp"
#include "switchyard/router.hpp"
// IWYU pragma: end_exports
