#pragma once

#include <any>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>

#include "bolt/flat-hash-map.hpp"
#include "bolt/handler.hpp"
#include "bolt/http-request.hpp"
#include "bolt/path-params.hpp"
#include "bolt/response-writer.hpp"

namespace bolt {

class Dispatcher;

// Per-request state passed along a handler chain.
//
// A Context is a reusable slot owned by a ContextPool: it is reset when acquired for a new request and keeps its
// allocated capacity (Params, Store) across requests. It must only be used by the thread serving the request it is
// currently bound to, and no reference to it may be kept once it has been released to its pool.
class Context {
 public:
  explicit Context(uint32_t maxParams);

  Context(const Context&) = delete;
  Context(Context&&) = delete;
  Context& operator=(const Context&) = delete;
  Context& operator=(Context&&) = delete;

  ~Context() = default;

  // Binds this context to a new request. Params, Store, chain, cursor, halted state and captured exception from
  // the previous request are all cleared.
  void reset(HttpRequest& request, ResponseWriter& response) noexcept;

  // Prerequisite: reset() has been called.
  [[nodiscard]] HttpRequest& request() const noexcept { return *_pRequest; }

  // Prerequisite: reset() has been called.
  [[nodiscard]] ResponseWriter& response() const noexcept { return *_pResponse; }

  [[nodiscard]] const Params& params() const noexcept { return _params; }

  // Value captured for the path parameter 'name', or an empty view.
  [[nodiscard]] std::string_view param(std::string_view name) const noexcept { return _params.valueOrEmpty(name); }

  // Stores 'value' under 'key', replacing any previous value.
  template <class T>
  void set(std::string_view key, T&& value) {
    _store[storeKey(key)] = std::any(std::forward<T>(value));
  }

  // Pointer to the value stored under 'key' if it exists and holds a T, nullptr otherwise.
  template <class T>
  [[nodiscard]] T* get(std::string_view key) {
    std::any* pValue = find(key);
    return pValue == nullptr ? nullptr : std::any_cast<T>(pValue);
  }

  template <class T>
  [[nodiscard]] const T* get(std::string_view key) const {
    const std::any* pValue = find(key);
    return pValue == nullptr ? nullptr : std::any_cast<T>(pValue);
  }

  [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

  // Returns true if a value was removed.
  bool erase(std::string_view key);

  [[nodiscard]] std::size_t storeSize() const noexcept { return _store.size(); }

  // Runs the next handler of the chain, if any.
  // Re-entrant: a handler calls next() to hand over to the rest of the chain and gets control back once it returns.
  // A handler returning without calling next() ends the chain, later next() calls then do nothing.
  // Nothing runs after halt() was called.
  void next();

  // Terminates the chain for good, even for handlers up the stack which would call next() again.
  void halt() noexcept { _halted = true; }

  [[nodiscard]] bool halted() const noexcept { return _halted; }

  // Binds 'chain' with a fresh cursor and runs its first handler.
  // Params and Store are kept, the halted state is cleared.
  void run(const HandlerChain& chain);

  // Exception raised by a handler of this request and caught by the dispatcher, if any.
  // Set before the internal error chain runs so that it can inspect the failure.
  [[nodiscard]] const std::exception_ptr& exception() const noexcept { return _exception; }

 private:
  friend class Dispatcher;

  [[nodiscard]] std::any* find(std::string_view key);
  [[nodiscard]] const std::any* find(std::string_view key) const;

  // Copies 'key' into a buffer whose capacity survives across requests, for lookups without allocation.
  const std::string& storeKey(std::string_view key) const {
    _storeKeyBuf.assign(key);
    return _storeKeyBuf;
  }

  HttpRequest* _pRequest{nullptr};
  ResponseWriter* _pResponse{nullptr};
  Params _params;
  flat_hash_map<std::string, std::any> _store;
  mutable std::string _storeKeyBuf;
  const HandlerChain* _pHandlers{nullptr};
  std::size_t _nextPos{0};
  bool _halted{false};
  bool _ended{false};
  std::exception_ptr _exception;
};

}  // namespace bolt
