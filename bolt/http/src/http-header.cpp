#include "bolt/http-header.hpp"

#include <algorithm>
#include <optional>
#include <span>
#include <string_view>

#include "bolt/string-equal-ignore-case.hpp"

namespace bolt::http {

namespace {

constexpr bool IsTokenChar(char ch) {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  static constexpr std::string_view kTokenSpecials = "!#$%&'*+-.^_`|~";
  return kTokenSpecials.find(ch) != std::string_view::npos;
}

}  // namespace

std::optional<std::string_view> FindHeaderValue(std::span<const HttpHeader> headers, std::string_view name) noexcept {
  const auto it = std::ranges::find_if(
      headers, [name](const HttpHeader& header) { return CaseInsensitiveEqual(header.name, name); });
  if (it == headers.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, IsTokenChar);
}

}  // namespace bolt::http
