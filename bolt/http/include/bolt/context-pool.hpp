#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

#include "bolt/context.hpp"
#include "bolt/vector.hpp"

namespace bolt {

// Thread-safe cache of reusable Context objects.
//
// Contexts are created lazily when no idle one is available and are only destroyed with the pool, so the number of
// live contexts is bounded by the peak number of concurrent requests. The pool does not reset contexts: whoever
// acquires one binds it to its request with Context::reset().
class ContextPool {
 public:
  // Scoped ownership of an acquired Context. The context goes back to its pool when the lease is destroyed or
  // released, whatever happened in between.
  class Lease {
   public:
    Lease() noexcept = default;

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    ~Lease() { release(); }

    [[nodiscard]] Context& operator*() const noexcept { return *_pContext; }
    [[nodiscard]] Context* operator->() const noexcept { return _pContext.get(); }
    [[nodiscard]] Context* get() const noexcept { return _pContext.get(); }

    explicit operator bool() const noexcept { return _pContext != nullptr; }

    // Gives the context back to the pool now. No-op on an empty lease.
    void release() noexcept;

   private:
    friend class ContextPool;

    Lease(ContextPool& pool, std::unique_ptr<Context> pContext) noexcept
        : _pPool(&pool), _pContext(std::move(pContext)) {}

    ContextPool* _pPool{nullptr};
    std::unique_ptr<Context> _pContext;
  };

  // Contexts created by this pool hold up to 'maxParams' path parameters.
  // 'initialSize' contexts are created upfront.
  explicit ContextPool(uint32_t maxParams, std::size_t initialSize = 0);

  ContextPool(const ContextPool&) = delete;
  ContextPool(ContextPool&&) = delete;
  ContextPool& operator=(const ContextPool&) = delete;
  ContextPool& operator=(ContextPool&&) = delete;

  ~ContextPool();

  // Returns an idle context, or a new one if none is available. Safe to call concurrently.
  [[nodiscard]] Lease acquire();

  // Number of contexts currently waiting in the pool.
  [[nodiscard]] std::size_t nbIdle() const;

  // Number of contexts created so far by this pool.
  [[nodiscard]] std::size_t nbCreated() const;

  [[nodiscard]] uint32_t maxParams() const noexcept { return _maxParams; }

 private:
  void giveBack(std::unique_ptr<Context> pContext) noexcept;

  mutable std::mutex _mutex;
  vector<std::unique_ptr<Context>> _idle;
  std::size_t _nbCreated{0};
  uint32_t _maxParams;
};

}  // namespace bolt
