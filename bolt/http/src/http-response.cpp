#include "bolt/http-response.hpp"

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "bolt/http-header.hpp"
#include "bolt/http-status-code.hpp"

namespace bolt {

void HttpResponse::addHeader(std::string_view name, std::string_view value) {
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument(std::format("Invalid header name '{}'", name));
  }
  _headers.push_back(http::HttpHeader{std::string(name), std::string(value)});
}

void HttpResponse::clear() noexcept {
  _headers.clear();
  _body.clear();
  _status = http::StatusCodeOK;
}

}  // namespace bolt
