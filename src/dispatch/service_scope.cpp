// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/service_scope.hpp"
#include "util/logging.hpp"

namespace courier {
namespace dispatch {

const char *LifetimeName(Lifetime lifetime) {
  switch (lifetime) {
  case Lifetime::Default:
    return "default";
  case Lifetime::Transient:
    return "transient";
  case Lifetime::Scoped:
    return "scoped";
  case Lifetime::Singleton:
    return "singleton";
  }
  return "unknown";
}

class ServiceProvider::ChildScope : public Scope {
public:
  explicit ChildScope(ServiceProvider &root) : root_(root) {}

  std::shared_ptr<void> Resolve(const TypeInfo &type) override {
    return root_.ResolveFor(type, *this, this);
  }

  std::shared_ptr<void> GetOrCreate(std::type_index id, const Factory &factory) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = instances_.find(id);
      if (it != instances_.end()) {
        return it->second;
      }
    }

    // Factory may resolve further scoped services from this scope
    std::shared_ptr<void> created = factory(*this);
    if (!created) {
      return nullptr;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = instances_.emplace(id, std::move(created));
    return it->second;
  }

private:
  ServiceProvider &root_;
  std::mutex mutex_;
  std::unordered_map<std::type_index, std::shared_ptr<void>> instances_;
};

std::unique_ptr<Scope> ServiceProvider::CreateScope() {
  return std::make_unique<ChildScope>(*this);
}

void ServiceProvider::Register(const TypeInfo &type, Lifetime lifetime, Factory factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (registrations_.count(type.id()) > 0) {
    LOG_REGISTRY_DEBUG("Service {} re-registered as {}", type.name(), LifetimeName(lifetime));
  }
  registrations_[type.id()] = Registration{lifetime, std::move(factory)};
  singletons_.erase(type.id());
}

bool ServiceProvider::IsRegistered(const TypeInfo &type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registrations_.count(type.id()) > 0;
}

std::shared_ptr<void> ServiceProvider::Resolve(const TypeInfo &type) {
  return ResolveFor(type, *this, nullptr);
}

std::shared_ptr<void> ServiceProvider::ResolveFor(const TypeInfo &type, Scope &requester,
                                                  ChildScope *child) {
  Registration registration;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(type.id());
    if (it == registrations_.end()) {
      return nullptr;
    }
    registration = it->second;

    bool root_cached = registration.lifetime == Lifetime::Singleton ||
                       (registration.lifetime == Lifetime::Scoped && child == nullptr);
    if (root_cached) {
      auto cached = singletons_.find(type.id());
      if (cached != singletons_.end()) {
        return cached->second;
      }
    }
  }

  switch (registration.lifetime) {
  case Lifetime::Transient:
  case Lifetime::Default:
    return registration.factory(requester);
  case Lifetime::Scoped:
    if (child != nullptr) {
      return child->GetOrCreate(type.id(), registration.factory);
    }
    return CacheSingleton(type.id(), registration.factory(*this));
  case Lifetime::Singleton:
    // Singletons never capture scoped services of the requesting scope
    return CacheSingleton(type.id(), registration.factory(*this));
  }
  return nullptr;
}

std::shared_ptr<void> ServiceProvider::CacheSingleton(std::type_index id,
                                                      std::shared_ptr<void> created) {
  if (!created) {
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  // A concurrent resolver may have won the race; first instance wins
  auto [it, inserted] = singletons_.emplace(id, std::move(created));
  return it->second;
}

} // namespace dispatch
} // namespace courier
