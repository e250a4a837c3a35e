#include "bolt/context.hpp"

#include <any>
#include <cstdint>
#include <string>
#include <string_view>

#include "bolt/handler.hpp"
#include "bolt/http-request.hpp"
#include "bolt/response-writer.hpp"

namespace bolt {

Context::Context(uint32_t maxParams) : _params(maxParams) {}

void Context::reset(HttpRequest& request, ResponseWriter& response) noexcept {
  _pRequest = &request;
  _pResponse = &response;
  _params.clear();
  _store.clear();
  _pHandlers = nullptr;
  _nextPos = 0;
  _halted = false;
  _ended = false;
  _exception = nullptr;
}

void Context::next() {
  if (_halted || _ended || _pHandlers == nullptr) {
    return;
  }
  const std::size_t pos = _nextPos;
  if (pos >= _pHandlers->size()) {
    _ended = true;
    return;
  }
  ++_nextPos;
  (*_pHandlers)[pos](*this);
  if (_nextPos == pos + 1U) {
    // The handler returned without handing over to the rest of the chain.
    _ended = true;
  }
}

void Context::run(const HandlerChain& chain) {
  _pHandlers = &chain;
  _nextPos = 0;
  _halted = false;
  _ended = false;
  next();
}

bool Context::erase(std::string_view key) { return _store.erase(storeKey(key)) != 0; }

std::any* Context::find(std::string_view key) {
  const auto it = _store.find(storeKey(key));
  return it == _store.end() ? nullptr : &it->second;
}

const std::any* Context::find(std::string_view key) const {
  const auto it = _store.find(storeKey(key));
  return it == _store.end() ? nullptr : &it->second;
}

}  // namespace bolt
