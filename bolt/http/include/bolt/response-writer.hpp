#pragma once

#include <string_view>

#include "bolt/http-status-code.hpp"

namespace bolt {

// Write side of a request, implemented by the host HTTP stack.
// The dispatcher never writes on its own: everything a client sees goes through handlers calling this interface.
class ResponseWriter {
 public:
  ResponseWriter() noexcept = default;

  ResponseWriter(const ResponseWriter&) = delete;
  ResponseWriter& operator=(const ResponseWriter&) = delete;

  virtual ~ResponseWriter() = default;

  virtual void status(http::StatusCode statusCode) = 0;

  virtual void addHeader(std::string_view name, std::string_view value) = 0;

  // Appends to the response body.
  virtual void write(std::string_view data) = 0;

 protected:
  ResponseWriter(ResponseWriter&&) noexcept = default;
  ResponseWriter& operator=(ResponseWriter&&) noexcept = default;
};

}  // namespace bolt
