#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "switchyard/http-constants.hpp"
#include "switchyard/http-header.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/vector.hpp"

namespace switchyard {

// Response produced by a route handler (or by the router itself for unmatched requests).
// Serialization to the wire is left to the transport.
class HttpResponse {
 public:
  // Creates a response with given status code and reason.
  // If reason is empty, the canonical reason phrase of the status code is used (if known).
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK, std::string_view reason = {});

  // Creates a 200 OK response with given body and content type.
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain);

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  // Get the value of the first header with given key (case-insensitive), or std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept;

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return headerValue(key).value_or(std::string_view{});
  }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Sets the status code. The reason phrase is reset to the canonical one of the new code.
  HttpResponse& status(http::StatusCode statusCode) & {
    setStatusCode(statusCode, {});
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && {
    setStatusCode(statusCode, {});
    return std::move(*this);
  }

  HttpResponse& status(http::StatusCode statusCode, std::string_view reason) & {
    setStatusCode(statusCode, reason);
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode, std::string_view reason) && {
    setStatusCode(statusCode, reason);
    return std::move(*this);
  }

  HttpResponse& reason(std::string_view reason) & {
    _reason = reason;
    return *this;
  }

  HttpResponse&& reason(std::string_view reason) && {
    _reason = reason;
    return std::move(*this);
  }

  // Appends a header line, keeping any existing header with the same name.
  // Throws std::invalid_argument if the header name or value is invalid.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _headers.emplace_back(key, value);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    _headers.emplace_back(key, value);
    return std::move(*this);
  }

  // Sets a header, replacing the first existing header with the same (case-insensitive) name.
  // Throws std::invalid_argument if the header name or value is invalid.
  HttpResponse& header(std::string_view key, std::string_view value) & {
    setHeader(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    setHeader(key, value);
    return std::move(*this);
  }

  // Sets the body and its Content-Type header.
  // An empty body removes the Content-Type header.
  HttpResponse& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) & {
    setBody(body, contentType);
    return *this;
  }

  HttpResponse&& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlain) && {
    setBody(body, contentType);
    return std::move(*this);
  }

 private:
  void setStatusCode(http::StatusCode statusCode, std::string_view reason);

  void setHeader(std::string_view key, std::string_view value);

  void eraseHeader(std::string_view key);

  void setBody(std::string_view body, std::string_view contentType);

  std::string _reason;
  vector<http::Header> _headers;
  std::string _body;
  http::StatusCode _statusCode{http::StatusCodeOK};
};

}  // namespace switchyard
