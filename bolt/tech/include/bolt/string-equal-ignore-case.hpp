#pragma once

#include <string_view>

namespace bolt {

constexpr char tolower(char ch) noexcept {
  if (ch >= 'A' && ch <= 'Z') {
    ch = static_cast<char>(ch | 0x20);
  }
  return ch;
}

// ASCII only, which is what HTTP tokens (methods, header names) are made of.
constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

struct CaseInsensitiveEqualFunc {
  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace bolt
