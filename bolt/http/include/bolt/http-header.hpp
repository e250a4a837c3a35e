#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace bolt::http {

struct HttpHeader {
  std::string name;
  std::string value;
};

// Returns the value of the first header named 'name' (ASCII case-insensitive), if any.
std::optional<std::string_view> FindHeaderValue(std::span<const HttpHeader> headers, std::string_view name) noexcept;

// Checks that 'name' is a non-empty RFC 9110 token.
bool IsValidHeaderName(std::string_view name) noexcept;

}  // namespace bolt::http
