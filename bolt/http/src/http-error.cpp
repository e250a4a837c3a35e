#include "bolt/http-error.hpp"

#include <string_view>

#include "bolt/http-constants.hpp"
#include "bolt/http-status-code.hpp"
#include "bolt/response-writer.hpp"

namespace bolt::http {

void WriteError(ResponseWriter& response, StatusCode status, std::string_view message) {
  response.addHeader(ContentType, ContentTypeTextPlainUtf8);
  response.addHeader(XContentTypeOptions, nosniff);
  response.status(status);
  response.write(message);
  response.write("\n");
}

void WriteError(ResponseWriter& response, StatusCode status) { WriteError(response, status, ReasonPhraseFor(status)); }

}  // namespace bolt::http
