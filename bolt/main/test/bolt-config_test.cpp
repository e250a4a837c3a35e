#include "bolt/bolt-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

#include "bolt/context.hpp"
#include "bolt/handler.hpp"
#include "bolt/http-constants.hpp"
#include "bolt/http-request.hpp"
#include "bolt/http-response.hpp"
#include "bolt/http-status-code.hpp"

namespace bolt {

TEST(BoltConfig, Defaults) {
  BoltConfig config;
  EXPECT_EQ(config.maxParams, 5U);
  EXPECT_EQ(config.initialPoolSize, 0U);
  EXPECT_EQ(config.handlerExceptionPolicy, BoltConfig::HandlerExceptionPolicy::InternalError);
  EXPECT_EQ(config.notFoundHandler.size(), 1U);
  EXPECT_EQ(config.methodNotAllowedHandler.size(), 1U);
  EXPECT_EQ(config.internalErrorHandler.size(), 1U);
  EXPECT_NO_THROW(config.validate());
}

TEST(BoltConfig, FluentSetters) {
  BoltConfig config;
  config.withMaxParams(8)
      .withInitialPoolSize(16)
      .withHandlerExceptionPolicy(BoltConfig::HandlerExceptionPolicy::Propagate)
      .withNotFoundHandler(MakeChain([](Context&) {}, [](Context&) {}));
  EXPECT_EQ(config.maxParams, 8U);
  EXPECT_EQ(config.initialPoolSize, 16U);
  EXPECT_EQ(config.handlerExceptionPolicy, BoltConfig::HandlerExceptionPolicy::Propagate);
  EXPECT_EQ(config.notFoundHandler.size(), 2U);
  EXPECT_NO_THROW(config.validate());
}

TEST(BoltConfig, MaxParamsBounds) {
  EXPECT_THROW(BoltConfig{}.withMaxParams(0).validate(), std::invalid_argument);
  EXPECT_NO_THROW(BoltConfig{}.withMaxParams(1).validate());
  EXPECT_NO_THROW(BoltConfig{}.withMaxParams(BoltConfig::kMaxParamsUpperBound).validate());
  EXPECT_THROW(BoltConfig{}.withMaxParams(BoltConfig::kMaxParamsUpperBound + 1).validate(), std::invalid_argument);
}

TEST(BoltConfig, EmptyFallbackChainsAreInvalid) {
  EXPECT_THROW(BoltConfig{}.withNotFoundHandler({}).validate(), std::invalid_argument);
  EXPECT_THROW(BoltConfig{}.withMethodNotAllowedHandler({}).validate(), std::invalid_argument);
  EXPECT_THROW(BoltConfig{}.withInternalErrorHandler(MakeChain(Handler{})).validate(), std::invalid_argument);
}

TEST(BoltConfig, DefaultChainsWriteErrorAndHalt) {
  struct Expected {
    HandlerChain chain;
    http::StatusCode status;
    std::string_view body;
  };
  Expected cases[] = {{DefaultNotFoundChain(), http::StatusCodeNotFound, "Not Found\n"},
                      {DefaultMethodNotAllowedChain(), http::StatusCodeMethodNotAllowed, "Method Not Allowed\n"},
                      {DefaultInternalErrorChain(), http::StatusCodeInternalServerError, "Internal Server Error\n"}};
  for (const Expected& expected : cases) {
    HttpRequest request("GET", "/");
    HttpResponse response;
    Context ctx(1);
    ctx.reset(request, response);
    ctx.run(expected.chain);

    EXPECT_TRUE(ctx.halted());
    EXPECT_EQ(response.status(), expected.status);
    EXPECT_EQ(response.body(), expected.body);
    EXPECT_EQ(response.headerValueOrEmpty(http::ContentType), http::ContentTypeTextPlainUtf8);
  }
}

}  // namespace bolt
