#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "bolt/http-header.hpp"
#include "bolt/vector.hpp"

namespace bolt {

// Read side of a request as handed over by the host HTTP stack.
// The dispatcher only needs method() and path(); handlers may look at the rest.
class HttpRequest {
 public:
  HttpRequest() = default;

  // 'target' is the request-target in origin-form: an absolute path optionally followed by '?query'.
  HttpRequest(std::string_view method, std::string_view target);

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Raw query string, without the leading '?'.
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::span<const http::HttpHeader> headers() const noexcept {
    return {_headers.data(), _headers.size()};
  }

  // Value of the first header with this name (case-insensitive).
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return http::FindHeaderValue(headers(), name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Throws std::invalid_argument if 'name' is not a valid header name.
  HttpRequest& addHeader(std::string_view name, std::string_view value);

  HttpRequest& body(std::string_view body);

 private:
  std::string _method;
  std::string _path;
  std::string _query;
  vector<http::HttpHeader> _headers;
  std::string _body;
};

}  // namespace bolt
