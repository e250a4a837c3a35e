#pragma once

#include <cstddef>
#include <cstdint>

#include "bolt/handler.hpp"

namespace bolt {

// Chains used when BoltConfig is left untouched. Each writes a plain text error with the matching status
// (404, 405 or 500) then halts the chain.
HandlerChain DefaultNotFoundChain();
HandlerChain DefaultMethodNotAllowedChain();
HandlerChain DefaultInternalErrorChain();

struct BoltConfig {
  // Behavior when a std::exception escapes a handler of a route or fallback chain.
  enum class HandlerExceptionPolicy : std::uint8_t {
    // Log the error, store it in the Context and run the internal error chain on the same Context.
    InternalError,
    // Rethrow the exception to the caller of dispatch(), after the Context went back to its pool.
    Propagate
  };

  static constexpr uint32_t kMaxParamsUpperBound = 255;

  // Maximum number of path parameters of a single route. Bounds the capacity of the Params of each Context.
  // Routes with more captures are rejected at registration. Default: 5.
  uint32_t maxParams{5};

  // Number of Contexts created with the Dispatcher. Others are created on demand. Default: 0.
  std::size_t initialPoolSize{0};

  HandlerExceptionPolicy handlerExceptionPolicy{HandlerExceptionPolicy::InternalError};

  // Run in place of the route chain when no route matches the path.
  HandlerChain notFoundHandler{DefaultNotFoundChain()};

  // Run in place of the route chain when the path matches a route not registered for the request method.
  // The dispatcher sets the 'Allow' header of the response before running it.
  HandlerChain methodNotAllowedHandler{DefaultMethodNotAllowedChain()};

  // Run after a handler failure, see HandlerExceptionPolicy. Context::exception() holds the failure.
  HandlerChain internalErrorHandler{DefaultInternalErrorChain()};

  BoltConfig& withMaxParams(uint32_t maxParams);

  BoltConfig& withInitialPoolSize(std::size_t initialPoolSize);

  BoltConfig& withHandlerExceptionPolicy(HandlerExceptionPolicy policy);

  BoltConfig& withNotFoundHandler(HandlerChain chain);

  BoltConfig& withMethodNotAllowedHandler(HandlerChain chain);

  BoltConfig& withInternalErrorHandler(HandlerChain chain);

  // Throws std::invalid_argument if the configuration is inconsistent.
  void validate() const;
};

}  // namespace bolt
