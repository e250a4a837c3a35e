#pragma once

#include <string_view>

#include "bolt/http-status-code.hpp"
#include "bolt/response-writer.hpp"

namespace bolt::http {

// Writes a plain text error: the given status, 'Content-Type: text/plain; charset=utf-8',
// 'X-Content-Type-Options: nosniff' and 'message' followed by a new line as body.
void WriteError(ResponseWriter& response, StatusCode status, std::string_view message);

// Same as above, with the reason phrase of 'status' as message.
void WriteError(ResponseWriter& response, StatusCode status);

}  // namespace bolt::http
