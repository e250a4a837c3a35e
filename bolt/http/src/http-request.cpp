#include "bolt/http-request.hpp"

#include <format>
#include <stdexcept>
#include <string_view>

#include "bolt/http-header.hpp"

namespace bolt {

HttpRequest::HttpRequest(std::string_view method, std::string_view target) : _method(method) {
  const auto queryPos = target.find('?');
  if (queryPos == std::string_view::npos) {
    _path.assign(target);
  } else {
    _path.assign(target.substr(0, queryPos));
    _query.assign(target.substr(queryPos + 1U));
  }
  if (_path.empty()) {
    _path.push_back('/');
  }
}

HttpRequest& HttpRequest::addHeader(std::string_view name, std::string_view value) {
  if (!http::IsValidHeaderName(name)) {
    throw std::invalid_argument(std::format("Invalid header name '{}'", name));
  }
  _headers.push_back(http::HttpHeader{std::string(name), std::string(value)});
  return *this;
}

HttpRequest& HttpRequest::body(std::string_view body) {
  _body.assign(body);
  return *this;
}

}  // namespace bolt
