// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/instance_cache.hpp"
#include "dispatch/errors.hpp"
#include "util/logging.hpp"

namespace courier {
namespace dispatch {

namespace {

std::shared_ptr<void> Construct(const std::string &name, const InstanceFactory &factory,
                                Scope &scope) {
  if (!factory) {
    throw ConstructionError(name, "no factory available");
  }
  std::shared_ptr<void> instance;
  try {
    instance = factory(scope);
  } catch (const ConstructionError &) {
    throw;
  } catch (const std::exception &e) {
    throw ConstructionError(name, e.what(), std::current_exception());
  }
  if (!instance) {
    throw ConstructionError(name, "factory returned null");
  }
  return instance;
}

} // namespace

InstanceCache::InstanceCache(size_t slot_count) : slots_(slot_count) {}

std::shared_ptr<void> InstanceCache::AcquireHandler(const HandlerDescriptor &handler,
                                                    Scope &scope) {
  return Acquire(handler.activation(), handler.slot, handler.name, handler.handler_type,
                 handler.factory, scope);
}

std::shared_ptr<void> InstanceCache::AcquireMiddleware(const MiddlewareDescriptor &middleware,
                                                       Scope &scope) {
  return Acquire(middleware.activation(), middleware.slot, middleware.name,
                 middleware.middleware_type, middleware.factory, scope);
}

bool InstanceCache::IsCached(size_t slot) const {
  return slot < slots_.size() && slots_[slot].ready.load(std::memory_order_acquire);
}

std::shared_ptr<void> InstanceCache::Acquire(ActivationKind activation, size_t slot_index,
                                             const std::string &name, const TypeInfo *type,
                                             const InstanceFactory &factory, Scope &scope) {
  switch (activation) {
  case ActivationKind::None:
    return nullptr;

  case ActivationKind::ResolveEveryCall: {
    std::shared_ptr<void> instance;
    try {
      instance = scope.Resolve(*type);
    } catch (const ConstructionError &) {
      throw;
    } catch (const std::exception &e) {
      throw ConstructionError(name, e.what(), std::current_exception());
    }
    if (!instance) {
      throw ConstructionError(name, "not registered in the active scope");
    }
    return instance;
  }

  case ActivationKind::CachedOnce: {
    if (slot_index >= slots_.size()) {
      throw ConstructionError(name, "instance slot out of range");
    }
    Slot &slot = slots_[slot_index];
    if (slot.ready.load(std::memory_order_acquire)) {
      return slot.instance;
    }

    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.ready.load(std::memory_order_relaxed)) {
      return slot.instance;
    }
    // Throws without touching the slot
    slot.instance = Construct(name, factory, scope);
    slot.ready.store(true, std::memory_order_release);
    LOG_PIPELINE_DEBUG("Constructed cached instance of {}", name);
    return slot.instance;
  }
  }
  return nullptr;
}

} // namespace dispatch
} // namespace courier
