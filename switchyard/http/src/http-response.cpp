#include "switchyard/http-response.hpp"

#include <algorithm>
#include <optional>
#include <string_view>
#include <utility>

#include "switchyard/ascii.hpp"
#include "switchyard/http-constants.hpp"
#include "switchyard/http-header.hpp"
#include "switchyard/http-status-code.hpp"

namespace switchyard {

namespace {

auto FindHeader(auto& headers, std::string_view key) noexcept {
  return std::ranges::find_if(headers,
                              [key](const http::Header& header) { return CaseInsensitiveEqual(header.name(), key); });
}

}  // namespace

HttpResponse::HttpResponse(http::StatusCode code, std::string_view reason) { setStatusCode(code, reason); }

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType) : HttpResponse(http::StatusCodeOK) {
  setBody(body, contentType);
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view key) const noexcept {
  const auto it = FindHeader(_headers, key);
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->value();
}

void HttpResponse::setStatusCode(http::StatusCode statusCode, std::string_view reason) {
  _statusCode = statusCode;
  _reason = reason.empty() ? http::ReasonPhraseFor(statusCode) : reason;
}

void HttpResponse::setHeader(std::string_view key, std::string_view value) {
  http::Header newHeader(key, value);
  auto it = FindHeader(_headers, key);
  if (it == _headers.end()) {
    _headers.push_back(std::move(newHeader));
  } else {
    *it = std::move(newHeader);
  }
}

void HttpResponse::eraseHeader(std::string_view key) {
  auto it = FindHeader(_headers, key);
  if (it != _headers.end()) {
    _headers.erase(it);
  }
}

void HttpResponse::setBody(std::string_view body, std::string_view contentType) {
  _body = body;
  if (body.empty()) {
    eraseHeader(http::ContentType);
  } else {
    setHeader(http::ContentType, contentType);
  }
}

}  // namespace switchyard
