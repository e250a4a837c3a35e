#include "bolt/http-error.hpp"

#include <gtest/gtest.h>

#include "bolt/http-constants.hpp"
#include "bolt/http-response.hpp"
#include "bolt/http-status-code.hpp"

namespace bolt::http {

TEST(HttpError, WriteErrorWithMessage) {
  HttpResponse resp;
  WriteError(resp, StatusCodeBadRequest, "missing id");

  EXPECT_EQ(resp.status(), StatusCodeBadRequest);
  EXPECT_EQ(resp.body(), "missing id\n");
  EXPECT_EQ(resp.headerValueOrEmpty(ContentType), ContentTypeTextPlainUtf8);
  EXPECT_EQ(resp.headerValueOrEmpty(XContentTypeOptions), nosniff);
}

TEST(HttpError, WriteErrorUsesReasonPhrase) {
  HttpResponse resp;
  WriteError(resp, StatusCodeNotFound);
  EXPECT_EQ(resp.status(), StatusCodeNotFound);
  EXPECT_EQ(resp.body(), "Not Found\n");

  HttpResponse resp405;
  WriteError(resp405, StatusCodeMethodNotAllowed);
  EXPECT_EQ(resp405.body(), "Method Not Allowed\n");
}

TEST(HttpConstants, ReasonPhraseFor) {
  EXPECT_EQ(ReasonPhraseFor(StatusCodeOK), ReasonOK);
  EXPECT_EQ(ReasonPhraseFor(StatusCodeInternalServerError), "Internal Server Error");
  EXPECT_TRUE(ReasonPhraseFor(299).empty());
  static_assert(ReasonPhraseFor(StatusCodeNotFound) == "Not Found");
}

}  // namespace bolt::http
