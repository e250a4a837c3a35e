#include "bolt/bolt-config.hpp"

#include <cstddef>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "bolt/context.hpp"
#include "bolt/handler.hpp"
#include "bolt/http-error.hpp"
#include "bolt/http-status-code.hpp"

namespace bolt {

namespace {

HandlerChain ErrorChain(http::StatusCode status) {
  return MakeChain([status](Context& ctx) {
    http::WriteError(ctx.response(), status);
    ctx.halt();
  });
}

void CheckChain(const HandlerChain& chain, std::string_view name) {
  if (chain.empty()) {
    throw std::invalid_argument(std::format("{} chain must not be empty", name));
  }
  for (const Handler& handler : chain) {
    if (!handler) {
      throw std::invalid_argument(std::format("{} chain holds an empty handler", name));
    }
  }
}

}  // namespace

HandlerChain DefaultNotFoundChain() { return ErrorChain(http::StatusCodeNotFound); }

HandlerChain DefaultMethodNotAllowedChain() { return ErrorChain(http::StatusCodeMethodNotAllowed); }

HandlerChain DefaultInternalErrorChain() { return ErrorChain(http::StatusCodeInternalServerError); }

BoltConfig& BoltConfig::withMaxParams(uint32_t maxParams) {
  this->maxParams = maxParams;
  return *this;
}

BoltConfig& BoltConfig::withInitialPoolSize(std::size_t initialPoolSize) {
  this->initialPoolSize = initialPoolSize;
  return *this;
}

BoltConfig& BoltConfig::withHandlerExceptionPolicy(HandlerExceptionPolicy policy) {
  handlerExceptionPolicy = policy;
  return *this;
}

BoltConfig& BoltConfig::withNotFoundHandler(HandlerChain chain) {
  notFoundHandler = std::move(chain);
  return *this;
}

BoltConfig& BoltConfig::withMethodNotAllowedHandler(HandlerChain chain) {
  methodNotAllowedHandler = std::move(chain);
  return *this;
}

BoltConfig& BoltConfig::withInternalErrorHandler(HandlerChain chain) {
  internalErrorHandler = std::move(chain);
  return *this;
}

void BoltConfig::validate() const {
  if (maxParams == 0 || maxParams > kMaxParamsUpperBound) {
    throw std::invalid_argument(std::format("maxParams must be in [1, {}]", kMaxParamsUpperBound));
  }
  CheckChain(notFoundHandler, "notFoundHandler");
  CheckChain(methodNotAllowedHandler, "methodNotAllowedHandler");
  CheckChain(internalErrorHandler, "internalErrorHandler");
}

}  // namespace bolt
