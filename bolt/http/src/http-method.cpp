#include "bolt/http-method.hpp"

#include <optional>
#include <string>
#include <string_view>

#include "bolt/string-equal-ignore-case.hpp"

namespace bolt::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  // Longest method token is 7 chars (CONNECT, OPTIONS)
  if (str.size() < 3U || str.size() > 7U) {
    return std::nullopt;
  }
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (CaseInsensitiveEqual(str, kMethodStrings[methodIdx])) {
      return MethodFromIdx(methodIdx);
    }
  }
  return std::nullopt;
}

std::string MethodBmpToStr(MethodBmp methods) {
  std::string out;
  for (MethodIdx methodIdx = 0; methodIdx < kNbMethods; ++methodIdx) {
    if (IsMethodSet(methods, MethodFromIdx(methodIdx))) {
      if (!out.empty()) {
        out.append(", ");
      }
      out.append(kMethodStrings[methodIdx]);
    }
  }
  return out;
}

}  // namespace bolt::http
