// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/descriptors.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace courier {
namespace dispatch {

/**
 * InstanceCache - obtains handler and middleware instances
 *
 * - ActivationKind::None: no instance (free functions)
 * - ActivationKind::CachedOnce: built from the descriptor's factory on first
 *   use and reused for the cache's lifetime. A failed construction caches
 *   nothing, so the next call retries.
 * - ActivationKind::ResolveEveryCall: resolved from the active scope on every
 *   call; the scope decides its real lifetime.
 *
 * One slot per registry participant (descriptor slot index). Thread-safe.
 */
class InstanceCache {
public:
  explicit InstanceCache(size_t slot_count);

  InstanceCache(const InstanceCache &) = delete;
  InstanceCache &operator=(const InstanceCache &) = delete;

  // @throws ConstructionError when no instance can be obtained
  std::shared_ptr<void> AcquireHandler(const HandlerDescriptor &handler, Scope &scope);
  std::shared_ptr<void> AcquireMiddleware(const MiddlewareDescriptor &middleware, Scope &scope);

  bool IsCached(size_t slot) const;
  size_t slot_count() const { return slots_.size(); }

private:
  struct Slot {
    std::mutex mutex;
    std::atomic<bool> ready{false};
    std::shared_ptr<void> instance;
  };

  std::shared_ptr<void> Acquire(ActivationKind activation, size_t slot, const std::string &name,
                                const TypeInfo *type, const InstanceFactory &factory,
                                Scope &scope);

  std::vector<Slot> slots_;
};

} // namespace dispatch
} // namespace courier
