#include "bolt/context-pool.hpp"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "bolt/context.hpp"
#include "bolt/log.hpp"

namespace bolt {

ContextPool::Lease::Lease(Lease&& other) noexcept
    : _pPool(std::exchange(other._pPool, nullptr)), _pContext(std::move(other._pContext)) {}

ContextPool::Lease& ContextPool::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    release();
    _pPool = std::exchange(other._pPool, nullptr);
    _pContext = std::move(other._pContext);
  }
  return *this;
}

void ContextPool::Lease::release() noexcept {
  if (_pContext != nullptr) {
    _pPool->giveBack(std::move(_pContext));
    _pPool = nullptr;
  }
}

ContextPool::ContextPool(uint32_t maxParams, std::size_t initialSize) : _maxParams(maxParams) {
  _idle.reserve(initialSize);
  for (std::size_t idx = 0; idx < initialSize; ++idx) {
    _idle.push_back(std::make_unique<Context>(_maxParams));
  }
  _nbCreated = initialSize;
}

ContextPool::~ContextPool() {
  if (_idle.size() != _nbCreated) {
    log::error("ContextPool destroyed while {} context(s) are still leased", _nbCreated - _idle.size());
  }
}

ContextPool::Lease ContextPool::acquire() {
  {
    std::scoped_lock lock(_mutex);
    if (!_idle.empty()) {
      std::unique_ptr<Context> pContext = std::move(_idle.back());
      _idle.pop_back();
      return {*this, std::move(pContext)};
    }
  }

  auto pContext = std::make_unique<Context>(_maxParams);

  std::scoped_lock lock(_mutex);
  // Reserve room for every created context so that giving them back never allocates.
  _idle.reserve(_nbCreated + 1U);
  ++_nbCreated;
  log::debug("ContextPool grew to {} context(s)", _nbCreated);
  return {*this, std::move(pContext)};
}

std::size_t ContextPool::nbIdle() const {
  std::scoped_lock lock(_mutex);
  return _idle.size();
}

std::size_t ContextPool::nbCreated() const {
  std::scoped_lock lock(_mutex);
  return _nbCreated;
}

void ContextPool::giveBack(std::unique_ptr<Context> pContext) noexcept {
  std::scoped_lock lock(_mutex);
  assert(_idle.size() < _idle.capacity());
  _idle.push_back(std::move(pContext));
}

}  // namespace bolt
