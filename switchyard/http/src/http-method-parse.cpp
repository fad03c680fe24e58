#include "switchyard/http-method-parse.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "switchyard/ascii.hpp"
#include "switchyard/http-method.hpp"

namespace switchyard::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (CaseInsensitiveEqual(str, kMethodStrings[methodIdx])) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

std::string MethodBmpToStr(MethodBmp methods) {
  std::string ret;
  ForEachMethod(methods, [&ret](Method method) {
    if (!ret.empty()) {
      ret.append(", ");
    }
    ret.append(MethodToStr(method));
  });
  return ret;
}

}  // namespace switchyard::http
