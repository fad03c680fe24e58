#include "switchyard/http-request.hpp"

#include <algorithm>
#include <optional>
#include <string_view>
#include <utility>

#include "switchyard/ascii.hpp"
#include "switchyard/http-header.hpp"
#include "switchyard/http-method.hpp"

namespace switchyard {

HttpRequest::HttpRequest(http::Method method, std::string_view target) : _method(method) {
  const auto queryPos = target.find('?');
  if (queryPos != std::string_view::npos) {
    _query = target.substr(queryPos + 1U);
    target = target.substr(0, queryPos);
  }
  if (target.empty()) {
    _path = "/";
  } else {
    _path = target;
  }
}

std::optional<std::string_view> HttpRequest::headerValue(std::string_view headerKey) const noexcept {
  const auto it = std::ranges::find_if(
      _headers, [headerKey](const http::Header& header) { return CaseInsensitiveEqual(header.name(), headerKey); });
  if (it == _headers.end()) {
    return std::nullopt;
  }
  return it->value();
}

HttpRequest& HttpRequest::header(std::string_view key, std::string_view value) {
  http::Header newHeader(key, value);
  auto it = std::ranges::find_if(
      _headers, [key](const http::Header& header) { return CaseInsensitiveEqual(header.name(), key); });
  if (it == _headers.end()) {
    _headers.push_back(std::move(newHeader));
  } else {
    *it = std::move(newHeader);
  }
  return *this;
}

}  // namespace switchyard
