#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "bolt/http-header.hpp"
#include "bolt/http-status-code.hpp"
#include "bolt/response-writer.hpp"
#include "bolt/vector.hpp"

namespace bolt {

// ResponseWriter that keeps everything in memory.
// Hosts serializing responses after the handler chain returns can use it directly, and tests use it to observe
// what handlers wrote.
class HttpResponse final : public ResponseWriter {
 public:
  HttpResponse() noexcept = default;

  explicit HttpResponse(http::StatusCode statusCode) noexcept : _status(statusCode) {}

  HttpResponse(HttpResponse&&) noexcept = default;
  HttpResponse& operator=(HttpResponse&&) noexcept = default;

  ~HttpResponse() override = default;

  void status(http::StatusCode statusCode) override { _status = statusCode; }

  // Headers are kept in insertion order, duplicates included.
  // Throws std::invalid_argument if 'name' is not a valid header name.
  void addHeader(std::string_view name, std::string_view value) override;

  void write(std::string_view data) override { _body.append(data); }

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::span<const http::HttpHeader> headers() const noexcept {
    return {_headers.data(), _headers.size()};
  }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return http::FindHeaderValue(headers(), name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Back to a fresh 200 response with no header and an empty body.
  void clear() noexcept;

 private:
  vector<http::HttpHeader> _headers;
  std::string _body;
  http::StatusCode _status{http::StatusCodeOK};
};

}  // namespace bolt
