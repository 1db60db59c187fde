// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/errors.hpp"
#include "dispatch/type_info.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>

namespace courier {
namespace dispatch {

// How a handler or middleware instance is obtained
enum class Lifetime {
  Default,   // constructed once by the runtime and cached
  Transient, // resolved from the active scope on every call
  Scoped,    // resolved from the active scope on every call
  Singleton, // resolved from the active scope on every call
};

const char *LifetimeName(Lifetime lifetime);

/**
 * Scope - service locator borrowed by the dispatch runtime
 *
 * The runtime never owns or disposes a scope; the caller keeps it alive for
 * the duration of the dispatch (including asynchronous completion).
 */
class Scope {
public:
  virtual ~Scope() = default;

  // nullptr when the type is not registered. Factory failures propagate.
  virtual std::shared_ptr<void> Resolve(const TypeInfo &type) = 0;
};

template <typename T> std::shared_ptr<T> ResolveService(Scope &scope) {
  return std::static_pointer_cast<T>(scope.Resolve(TypeInfo::Get<T>()));
}

// @throws ConstructionError when T is not registered
template <typename T> std::shared_ptr<T> RequireService(Scope &scope) {
  auto service = ResolveService<T>(scope);
  if (!service) {
    throw ConstructionError(TypeInfo::Get<T>().name(), "service is not registered");
  }
  return service;
}

/**
 * ServiceProvider - minimal root scope with singleton, scoped and transient
 * registrations
 *
 * Scoped services resolved directly from the provider behave as singletons;
 * CreateScope() returns a child scope with its own scoped instances.
 * Registration and resolution are thread-safe. Factories run without any
 * provider lock held, so they may resolve their own dependencies.
 */
class ServiceProvider : public Scope {
public:
  using Factory = std::function<std::shared_ptr<void>(Scope &)>;

  ServiceProvider() = default;
  ServiceProvider(const ServiceProvider &) = delete;
  ServiceProvider &operator=(const ServiceProvider &) = delete;

  template <typename T>
  ServiceProvider &AddSingleton(std::function<std::shared_ptr<T>(Scope &)> factory) {
    Register(TypeInfo::Get<T>(), Lifetime::Singleton, Wrap<T>(std::move(factory)));
    return *this;
  }

  template <typename T> ServiceProvider &AddSingleton(std::shared_ptr<T> instance) {
    Register(TypeInfo::Get<T>(), Lifetime::Singleton,
             [instance](Scope &) -> std::shared_ptr<void> { return instance; });
    return *this;
  }

  template <typename T>
  ServiceProvider &AddScoped(std::function<std::shared_ptr<T>(Scope &)> factory) {
    Register(TypeInfo::Get<T>(), Lifetime::Scoped, Wrap<T>(std::move(factory)));
    return *this;
  }

  template <typename T>
  ServiceProvider &AddTransient(std::function<std::shared_ptr<T>(Scope &)> factory) {
    Register(TypeInfo::Get<T>(), Lifetime::Transient, Wrap<T>(std::move(factory)));
    return *this;
  }

  // Default-constructed transient
  template <typename T> ServiceProvider &AddTransient() {
    return AddTransient<T>([](Scope &) { return std::make_shared<T>(); });
  }

  std::unique_ptr<Scope> CreateScope();

  std::shared_ptr<void> Resolve(const TypeInfo &type) override;

  bool IsRegistered(const TypeInfo &type) const;

private:
  class ChildScope;

  struct Registration {
    Lifetime lifetime;
    Factory factory;
  };

  template <typename T>
  static Factory Wrap(std::function<std::shared_ptr<T>(Scope &)> factory) {
    return [factory = std::move(factory)](Scope &scope) -> std::shared_ptr<void> {
      return factory(scope);
    };
  }

  void Register(const TypeInfo &type, Lifetime lifetime, Factory factory);

  // Resolve on behalf of requester; child is nullptr at the root
  std::shared_ptr<void> ResolveFor(const TypeInfo &type, Scope &requester,
                                   ChildScope *child);

  std::shared_ptr<void> CacheSingleton(std::type_index id, std::shared_ptr<void> created);

  mutable std::mutex mutex_;
  std::unordered_map<std::type_index, Registration> registrations_;
  std::unordered_map<std::type_index, std::shared_ptr<void>> singletons_;
};

} // namespace dispatch
} // namespace courier
