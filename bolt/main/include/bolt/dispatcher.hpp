#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include "bolt/bolt-config.hpp"
#include "bolt/context-pool.hpp"
#include "bolt/handler.hpp"
#include "bolt/http-method.hpp"
#include "bolt/http-request.hpp"
#include "bolt/path-matcher.hpp"
#include "bolt/path-params.hpp"
#include "bolt/response-writer.hpp"

namespace bolt {

// Entry point of the dispatch core, meant to be called by the host HTTP stack once per request.
//
// Routes and middleware are registered during a startup phase. After that, dispatch() may be called concurrently
// from any number of threads, each request running to completion on its calling thread.
class Dispatcher {
 public:
  // Creates a Dispatcher with a default BoltConfig.
  Dispatcher();

  // Throws std::invalid_argument if 'config' does not validate.
  explicit Dispatcher(BoltConfig config);

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  ~Dispatcher();

  // Appends global middleware, run in registration order before the handlers of every route registered afterwards.
  template <class... Handlers>
  Dispatcher& use(Handlers&&... handlers) {
    (addMiddleware(Handler(std::forward<Handlers>(handlers))), ...);
    return *this;
  }

  // Registers 'chain' for 'method' on 'pattern', prefixed by the global middleware registered so far.
  // See PathMatcher::add for the pattern syntax and the exceptions thrown.
  Dispatcher& handle(http::Method method, std::string_view pattern, HandlerChain chain);

  Dispatcher& handle(std::string_view method, std::string_view pattern, HandlerChain chain);

  template <class... Handlers>
  Dispatcher& get(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::GET, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  template <class... Handlers>
  Dispatcher& head(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::HEAD, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  template <class... Handlers>
  Dispatcher& post(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::POST, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  template <class... Handlers>
  Dispatcher& put(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::PUT, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  // 'delete' is a keyword.
  template <class... Handlers>
  Dispatcher& del(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::DELETE, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  template <class... Handlers>
  Dispatcher& connect(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::CONNECT, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  template <class... Handlers>
  Dispatcher& options(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::OPTIONS, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  template <class... Handlers>
  Dispatcher& trace(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::TRACE, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  template <class... Handlers>
  Dispatcher& patch(std::string_view pattern, Handlers&&... handlers) {
    return handle(http::Method::PATCH, pattern, MakeChain(std::forward<Handlers>(handlers)...));
  }

  [[nodiscard]] PathMatcher::Result find(http::Method method, std::string_view path, Params& params) const {
    return _pathMatcher.find(method, path, params);
  }

  [[nodiscard]] PathMatcher::Result find(std::string_view method, std::string_view path, Params& params) const {
    return _pathMatcher.find(method, path, params);
  }

  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const {
    return _pathMatcher.allowedMethods(path);
  }

  // Resolves (method, path), then runs the matched chain, or the not found / method not allowed chain, on a pooled
  // Context bound to 'request' and 'response'. The Context always goes back to the pool before returning.
  // Handler exceptions are dealt with according to BoltConfig::handlerExceptionPolicy.
  void dispatch(std::string_view method, std::string_view path, HttpRequest& request, ResponseWriter& response);

  // Same as above, with the method and path of 'request'.
  void dispatch(HttpRequest& request, ResponseWriter& response) {
    dispatch(request.method(), request.path(), request, response);
  }

  [[nodiscard]] const BoltConfig& config() const noexcept { return _config; }

  [[nodiscard]] std::span<const Handler> middleware() const noexcept {
    return {_middleware.data(), _middleware.size()};
  }

  [[nodiscard]] const PathMatcher& pathMatcher() const noexcept { return _pathMatcher; }

  [[nodiscard]] const ContextPool& contextPool() const noexcept { return _contextPool; }

 private:
  void addMiddleware(Handler handler);

  BoltConfig _config;
  HandlerChain _middleware;
  PathMatcher _pathMatcher;
  ContextPool _contextPool;
};

}  // namespace bolt
