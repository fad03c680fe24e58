#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "switchyard/http-method.hpp"

namespace switchyard::http {

// Attempt to parse a HTTP method.
// RFC 9110 §9.1: The method token is case-sensitive, BUT:
// RFC 9110 §2.5. The RFC encourages robustness:
// "Although methods are case-sensitive, the implementation SHOULD be case-insensitive when parsing received messages.”
std::optional<Method> MethodStrToOptEnum(std::string_view str);

// Render the set methods of a bitmap in ascending method order, separated by ", ".
// Suitable for an 'Allow' header value. Returns an empty string for an empty bitmap.
std::string MethodBmpToStr(MethodBmp methods);

}  // namespace switchyard::http
