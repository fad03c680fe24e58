#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "switchyard/http-header.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/vector.hpp"

namespace switchyard {

// Inbound request as handed over by the transport layer.
// The transport owns socket I/O, framing and body decoding; it builds one HttpRequest per request
// and keeps it alive until the task returned by Router::dispatch() has completed.
class HttpRequest {
 public:
  // Builds a request for the given method and request target.
  // The target is split at the first '?' into the path and the raw query string (without the '?').
  // An empty path is treated as the root path "/".
  // No percent-decoding is performed.
  HttpRequest(http::Method method, std::string_view target);

  // The method of the request (GET, PUT, ...)
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // The path part of the target, never empty.
  // Example:
  //  GET /path          -> '/path'
  //  GET /path?key=val  -> '/path'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // The raw query string, without the leading '?'. Empty if absent.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  // Returns the header value for the given key, or std::nullopt if absent.
  // Lookup is case-insensitive.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view headerKey) const noexcept;

  // Like headerValue() but returns an empty string_view when the header is absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view headerKey) const noexcept {
    return headerValue(headerKey).value_or(std::string_view{});
  }

  // All headers, in insertion order.
  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Sets a header, replacing any existing one with the same (case-insensitive) name.
  // Throws std::invalid_argument if the header name or value is invalid.
  HttpRequest& header(std::string_view key, std::string_view value);

  HttpRequest& body(std::string body) noexcept {
    _body = std::move(body);
    return *this;
  }

 private:
  std::string _path;
  std::string _query;
  vector<http::Header> _headers;
  std::string _body;
  http::Method _method;
};

}  // namespace switchyard
