#include "bolt/dispatcher.hpp"

#include <exception>
#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "bolt/bolt-config.hpp"
#include "bolt/context-pool.hpp"
#include "bolt/context.hpp"
#include "bolt/handler.hpp"
#include "bolt/http-constants.hpp"
#include "bolt/http-method.hpp"
#include "bolt/http-request.hpp"
#include "bolt/log.hpp"
#include "bolt/path-matcher.hpp"
#include "bolt/response-writer.hpp"

namespace bolt {

namespace {

BoltConfig Validated(BoltConfig config) {
  config.validate();
  return config;
}

}  // namespace

Dispatcher::Dispatcher() : Dispatcher(BoltConfig{}) {}

Dispatcher::Dispatcher(BoltConfig config)
    : _config(Validated(std::move(config))),
      _pathMatcher(_config.maxParams),
      _contextPool(_config.maxParams, _config.initialPoolSize) {}

Dispatcher::~Dispatcher() = default;

void Dispatcher::addMiddleware(Handler handler) {
  if (!handler) {
    throw std::invalid_argument("Cannot register an empty middleware");
  }
  if (_pathMatcher.nbRoutes() != 0) {
    log::warn("Middleware registered after {} route(s) only applies to routes registered from now on",
              _pathMatcher.nbRoutes());
  }
  _middleware.push_back(std::move(handler));
}

Dispatcher& Dispatcher::handle(http::Method method, std::string_view pattern, HandlerChain chain) {
  if (chain.empty()) {
    throw std::invalid_argument("Cannot register a route without handler");
  }
  HandlerChain flattened;
  flattened.reserve(_middleware.size() + chain.size());
  for (const Handler& middleware : _middleware) {
    flattened.push_back(middleware);
  }
  for (Handler& handler : chain) {
    flattened.push_back(std::move(handler));
  }
  _pathMatcher.add(method, pattern, std::move(flattened));
  return *this;
}

Dispatcher& Dispatcher::handle(std::string_view method, std::string_view pattern, HandlerChain chain) {
  const auto optMethod = http::MethodStrToOptEnum(method);
  if (!optMethod) {
    throw std::invalid_argument(std::format("Unknown HTTP method '{}' for route '{}'", method, pattern));
  }
  return handle(*optMethod, pattern, std::move(chain));
}

void Dispatcher::dispatch(std::string_view method, std::string_view path, HttpRequest& request,
                          ResponseWriter& response) {
  ContextPool::Lease ctx = _contextPool.acquire();
  ctx->reset(request, response);

  const PathMatcher::Result result = _pathMatcher.find(method, path, ctx->_params);

  const HandlerChain* pChain = result.pChain;
  switch (result.status) {
    case PathMatcher::Status::Matched:
      break;
    case PathMatcher::Status::NotFound:
      log::debug("No route for {} {}", method, path);
      pChain = &_config.notFoundHandler;
      break;
    case PathMatcher::Status::NotAllowed:
      log::debug("Method {} not allowed for {}", method, path);
      response.addHeader(http::Allow, http::MethodBmpToStr(_pathMatcher.allowedMethods(path)));
      pChain = &_config.methodNotAllowedHandler;
      break;
  }

  try {
    ctx->run(*pChain);
  } catch (const std::exception& ex) {
    if (_config.handlerExceptionPolicy == BoltConfig::HandlerExceptionPolicy::Propagate) {
      throw;
    }
    log::error("Exception in handler for {} {}: {}", method, path, ex.what());
    ctx->_exception = std::current_exception();
    ctx->run(_config.internalErrorHandler);
  } catch (...) {
    if (_config.handlerExceptionPolicy == BoltConfig::HandlerExceptionPolicy::Propagate) {
      throw;
    }
    log::error("Unknown exception in handler for {} {}", method, path);
    ctx->_exception = std::current_exception();
    ctx->run(_config.internalErrorHandler);
  }
}

}  // namespace bolt
