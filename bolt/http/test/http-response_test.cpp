#include "bolt/http-response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>

#include "bolt/http-constants.hpp"
#include "bolt/http-status-code.hpp"
#include "bolt/response-writer.hpp"

namespace bolt {

TEST(HttpResponse, DefaultsToOkAndEmpty) {
  HttpResponse resp;
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_TRUE(resp.body().empty());
  EXPECT_TRUE(resp.headers().empty());
}

TEST(HttpResponse, RecordsWritesThroughInterface) {
  HttpResponse resp;
  ResponseWriter& writer = resp;
  writer.status(http::StatusCodeCreated);
  writer.addHeader(http::ContentType, http::ContentTypeApplicationJson);
  writer.addHeader(http::Location, "/users/7");
  writer.write("{");
  writer.write("}");

  EXPECT_EQ(resp.status(), http::StatusCodeCreated);
  EXPECT_EQ(resp.body(), "{}");
  ASSERT_EQ(resp.headers().size(), 2U);
  EXPECT_EQ(resp.headers()[0].name, http::ContentType);
  EXPECT_EQ(resp.headerValueOrEmpty("location"), "/users/7");
}

TEST(HttpResponse, InvalidHeaderNameThrows) {
  HttpResponse resp;
  EXPECT_THROW(resp.addHeader("Bad\r\nName", "v"), std::invalid_argument);
  EXPECT_TRUE(resp.headers().empty());
}

TEST(HttpResponse, ClearResets) {
  HttpResponse resp(http::StatusCodeNotFound);
  resp.addHeader(http::Allow, "GET");
  resp.write("body");
  resp.clear();
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_TRUE(resp.body().empty());
  EXPECT_TRUE(resp.headers().empty());
}

TEST(HttpResponse, Move) {
  HttpResponse resp(http::StatusCodeAccepted);
  resp.write("queued");
  HttpResponse moved(std::move(resp));
  EXPECT_EQ(moved.status(), http::StatusCodeAccepted);
  EXPECT_EQ(moved.body(), "queued");
}

}  // namespace bolt
