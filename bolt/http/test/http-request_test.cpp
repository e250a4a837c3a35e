#include "bolt/http-request.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

#include "bolt/http-constants.hpp"

namespace bolt {

TEST(HttpRequest, DefaultConstructed) {
  HttpRequest req;
  EXPECT_TRUE(req.method().empty());
  EXPECT_TRUE(req.path().empty());
  EXPECT_TRUE(req.headers().empty());
}

TEST(HttpRequest, SplitsTargetOnQuery) {
  HttpRequest req("GET", "/search?q=bolt&page=2");
  EXPECT_EQ(req.method(), "GET");
  EXPECT_EQ(req.path(), "/search");
  EXPECT_EQ(req.query(), "q=bolt&page=2");
}

TEST(HttpRequest, TargetWithoutQuery) {
  HttpRequest req("POST", "/users/42");
  EXPECT_EQ(req.path(), "/users/42");
  EXPECT_TRUE(req.query().empty());
}

TEST(HttpRequest, EmptyPathIsRoot) {
  EXPECT_EQ(HttpRequest("GET", "").path(), "/");
  HttpRequest req("GET", "?x=1");
  EXPECT_EQ(req.path(), "/");
  EXPECT_EQ(req.query(), "x=1");
}

TEST(HttpRequest, HeadersAreCaseInsensitive) {
  HttpRequest req("GET", "/");
  req.addHeader("Accept", "application/json").addHeader("X-Trace", "1").addHeader("x-trace", "2");

  EXPECT_EQ(req.headers().size(), 3U);
  EXPECT_EQ(req.headerValue("accept"), std::optional<std::string_view>(http::ContentTypeApplicationJson));
  // first one wins
  EXPECT_EQ(req.headerValueOrEmpty("X-TRACE"), "1");
  EXPECT_EQ(req.headerValue("Missing"), std::nullopt);
  EXPECT_TRUE(req.headerValueOrEmpty("Missing").empty());
}

TEST(HttpRequest, InvalidHeaderNameThrows) {
  HttpRequest req("GET", "/");
  EXPECT_THROW(req.addHeader("", "v"), std::invalid_argument);
  EXPECT_THROW(req.addHeader("Bad Name", "v"), std::invalid_argument);
  EXPECT_THROW(req.addHeader("Colon:", "v"), std::invalid_argument);
  EXPECT_TRUE(req.headers().empty());
}

TEST(HttpRequest, Body) {
  HttpRequest req("PUT", "/doc");
  req.body(R"({"a":1})");
  EXPECT_EQ(req.body(), R"({"a":1})");
}

}  // namespace bolt
