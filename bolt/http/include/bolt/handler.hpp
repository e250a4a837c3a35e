#pragma once

#include <functional>
#include <utility>

#include "bolt/vector.hpp"

namespace bolt {

class Context;

// A route handler or a middleware: both have the same shape.
// A handler continues the chain by calling Context::next() and may run code after it returns.
using Handler = std::function<void(Context&)>;

// Flattened, ordered sequence of handlers bound to a route.
using HandlerChain = vector<Handler>;

template <class... Handlers>
HandlerChain MakeChain(Handlers&&... handlers) {
  HandlerChain chain;
  chain.reserve(sizeof...(Handlers));
  (chain.emplace_back(std::forward<Handlers>(handlers)), ...);
  return chain;
}

}  // namespace bolt
