// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/handler_registry.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <unordered_set>

namespace courier {
namespace dispatch {

namespace {

bool OrderLess(const HandlerDescriptor *a, const HandlerDescriptor *b) {
  if (a->order != b->order) {
    return a->order < b->order;
  }
  return a->index < b->index;
}

} // namespace

HandlerRegistry::Builder &HandlerRegistry::Builder::Add(HandlerDescriptor descriptor) {
  if (descriptor.message_type == nullptr) {
    LOG_REGISTRY_WARN("Attempted to register handler without message type");
    throw std::invalid_argument("handler registration requires a message type");
  }
  if (descriptor.name.empty()) {
    LOG_REGISTRY_WARN("Attempted to register unnamed handler for {}",
                      descriptor.message_type->name());
    throw std::invalid_argument("handler for " + descriptor.message_type->name() +
                                " has an empty name");
  }
  if (!descriptor.invoke) {
    LOG_REGISTRY_WARN("Attempted to register empty handler {}", descriptor.name);
    throw std::invalid_argument("handler " + descriptor.name + " has no callable");
  }
  if (descriptor.activation() == ActivationKind::CachedOnce && !descriptor.factory) {
    throw std::invalid_argument("handler " + descriptor.name +
                                " is not default-constructible and has no factory");
  }

  descriptor.index = handlers_.size();
  LOG_REGISTRY_DEBUG("Registered handler {} for {} (order {}, {})", descriptor.name,
                     descriptor.message_type->name(), descriptor.order,
                     descriptor.is_async ? "async" : "sync");
  handlers_.push_back(std::move(descriptor));
  return *this;
}

HandlerRegistry::Builder &HandlerRegistry::Builder::Add(MiddlewareDescriptor descriptor) {
  if (descriptor.name.empty()) {
    throw std::invalid_argument("middleware registration requires a name");
  }
  if (descriptor.middleware_type == nullptr) {
    throw std::invalid_argument("middleware " + descriptor.name + " has no type");
  }
  if (!descriptor.before && !descriptor.after && !descriptor.finally && !descriptor.execute) {
    LOG_REGISTRY_WARN("Attempted to register middleware {} without phases", descriptor.name);
    throw std::invalid_argument("middleware " + descriptor.name + " declares no phase");
  }
  if (descriptor.activation() == ActivationKind::CachedOnce && !descriptor.factory) {
    throw std::invalid_argument("middleware " + descriptor.name +
                                " is not default-constructible and has no factory");
  }

  descriptor.index = middleware_.size();
  LOG_REGISTRY_DEBUG("Registered middleware {} for {}", descriptor.name,
                     descriptor.applies_to ? descriptor.applies_to->name() : "all messages");
  middleware_.push_back(std::move(descriptor));
  return *this;
}

HandlerRegistry::Builder &HandlerRegistry::Builder::Add(GenericHandlerDescriptor descriptor) {
  if (descriptor.name.empty()) {
    throw std::invalid_argument("generic handler registration requires a name");
  }
  if (descriptor.closers.empty()) {
    throw std::invalid_argument("generic handler " + descriptor.name +
                                " is not closed over any message type");
  }
  for (const auto &closer : descriptor.closers) {
    if (!closer.close) {
      throw std::invalid_argument("generic handler " + descriptor.name + " has no callable for " +
                                  closer.message_name);
    }
    if (descriptor.lifetime == Lifetime::Default && !closer.default_constructible) {
      LOG_REGISTRY_WARN("Generic handler {} cannot be built for {}", descriptor.name,
                        closer.message_name);
      throw std::invalid_argument("generic handler " + descriptor.name + " for " +
                                  closer.message_name + " is not default-constructible");
    }
  }

  descriptor.index = generic_.size();
  LOG_REGISTRY_DEBUG("Registered generic handler {} for {} ({} closed types)", descriptor.name,
                     descriptor.family_name, descriptor.closers.size());
  generic_.push_back(std::move(descriptor));
  return *this;
}

std::shared_ptr<const HandlerRegistry> HandlerRegistry::Builder::Build() {
  std::shared_ptr<HandlerRegistry> registry(new HandlerRegistry());

  size_t slot = 0;
  registry->handlers_.reserve(handlers_.size());
  for (auto &descriptor : handlers_) {
    descriptor.slot = slot++;
    registry->handlers_.push_back(std::make_unique<const HandlerDescriptor>(std::move(descriptor)));
  }
  registry->middleware_.reserve(middleware_.size());
  for (auto &descriptor : middleware_) {
    descriptor.slot = slot++;
    registry->middleware_.push_back(
        std::make_unique<const MiddlewareDescriptor>(std::move(descriptor)));
  }
  registry->generic_.reserve(generic_.size());
  for (auto &descriptor : generic_) {
    descriptor.first_slot = slot;
    slot += descriptor.closers.size();
    registry->generic_.push_back(
        std::make_unique<const GenericHandlerDescriptor>(std::move(descriptor)));
  }
  registry->slot_count_ = slot;
  handlers_.clear();
  middleware_.clear();
  generic_.clear();

  for (const auto &generic : registry->generic_) {
    registry->by_family_[generic->family].push_back(generic.get());
  }

  for (const auto &handler : registry->handlers_) {
    registry->by_message_[handler->message_type->id()].push_back(handler.get());
  }
  for (auto &[type, list] : registry->by_message_) {
    std::stable_sort(list.begin(), list.end(), OrderLess);
  }

  // Explicit opt-ins naming middleware that was never registered
  std::unordered_set<std::type_index> known;
  for (const auto &mw : registry->middleware_) {
    known.insert(mw->middleware_type->id());
  }
  for (const auto &handler : registry->handlers_) {
    for (const auto &requested : handler->use_middleware) {
      if (known.count(requested) == 0) {
        LOG_REGISTRY_WARN("Handler {} requests unregistered middleware {}", handler->name,
                          DemangleTypeName(requested.name()));
      }
    }
  }

  LOG_REGISTRY_INFO("Handler registry built: {} handlers, {} middleware, {} generic handlers",
                    registry->handlers_.size(), registry->middleware_.size(),
                    registry->generic_.size());
  return registry;
}

const std::vector<const HandlerDescriptor *> &
HandlerRegistry::Lookup(const TypeInfo &message_type) const {
  static const std::vector<const HandlerDescriptor *> kNone;
  auto it = by_message_.find(message_type.id());
  const auto &exact = it == by_message_.end() ? kNone : it->second;
  const auto &family = message_type.generic_family();
  if (!family || by_family_.count(*family) == 0) {
    return exact;
  }
  return LookupClosed(message_type, exact);
}

const std::vector<const HandlerDescriptor *> &
HandlerRegistry::LookupClosed(const TypeInfo &message_type,
                              const std::vector<const HandlerDescriptor *> &exact) const {
  std::lock_guard<std::mutex> lock(closed_mutex_);
  auto cached = closed_lists_.find(message_type.id());
  if (cached != closed_lists_.end()) {
    return cached->second;
  }

  std::vector<const HandlerDescriptor *> list = exact;
  for (const auto *generic : by_family_.at(*message_type.generic_family())) {
    for (size_t i = 0; i < generic->closers.size(); ++i) {
      const auto &closer = generic->closers[i];
      if (closer.message_type != message_type.id()) {
        continue;
      }
      HandlerDescriptor closed = closer.close();
      closed.slot = generic->first_slot + i;
      closed.index = handlers_.size() + generic->index;
      LOG_REGISTRY_DEBUG("Closed generic handler {} as {} for {}", generic->name, closed.name,
                         message_type.name());
      closed_handlers_.push_back(std::make_unique<const HandlerDescriptor>(std::move(closed)));
      list.push_back(closed_handlers_.back().get());
    }
  }
  std::stable_sort(list.begin(), list.end(), OrderLess);
  return closed_lists_.emplace(message_type.id(), std::move(list)).first->second;
}

std::vector<const HandlerDescriptor *>
HandlerRegistry::LookupForPublish(const TypeInfo &message_type) const {
  std::vector<const HandlerDescriptor *> result = Lookup(message_type);
  for (const TypeInfo *ancestor : message_type.Ancestors()) {
    const auto &inherited = Lookup(*ancestor);
    result.insert(result.end(), inherited.begin(), inherited.end());
  }

  // Each handler once (ancestry is deduplicated already; guard shared entries)
  std::unordered_set<const HandlerDescriptor *> seen;
  result.erase(std::remove_if(result.begin(), result.end(),
                              [&seen](const HandlerDescriptor *h) { return !seen.insert(h).second; }),
               result.end());
  std::stable_sort(result.begin(), result.end(), OrderLess);
  return result;
}

std::vector<const MiddlewareDescriptor *>
HandlerRegistry::MiddlewareFor(const HandlerDescriptor &handler,
                               const TypeInfo &message_type) const {
  std::vector<const MiddlewareDescriptor *> result;
  for (const auto &mw : middleware_) {
    if (!mw->Accepts(message_type)) {
      continue;
    }
    if (mw->explicit_only) {
      const auto &requested = handler.use_middleware;
      if (std::find(requested.begin(), requested.end(), mw->middleware_type->id()) ==
          requested.end()) {
        continue;
      }
    }
    result.push_back(mw.get());
  }

  std::stable_sort(result.begin(), result.end(),
                   [&message_type](const MiddlewareDescriptor *a, const MiddlewareDescriptor *b) {
                     return a->Specificity(message_type) < b->Specificity(message_type);
                   });
  std::stable_sort(result.begin(), result.end(),
                   [](const MiddlewareDescriptor *a, const MiddlewareDescriptor *b) {
                     return a->effective_order() < b->effective_order();
                   });
  return result;
}

std::vector<RegistrationInfo> HandlerRegistry::Registrations() const {
  std::vector<RegistrationInfo> rows;
  rows.reserve(handlers_.size());
  for (const auto &handler : handlers_) {
    RegistrationInfo info{handler->message_type->name(),
                          handler->name,
                          handler->order,
                          handler->is_async,
                          handler->returns_tuple,
                          handler->result_type_name,
                          handler->lifetime,
                          {}};
    for (const auto *mw : MiddlewareFor(*handler, *handler->message_type)) {
      info.middleware.push_back(mw->name);
    }
    rows.push_back(std::move(info));
  }
  std::sort(rows.begin(), rows.end(), [](const RegistrationInfo &a, const RegistrationInfo &b) {
    if (a.message_type != b.message_type) {
      return a.message_type < b.message_type;
    }
    return a.handler < b.handler;
  });
  return rows;
}

nlohmann::json HandlerRegistry::ToJson() const {
  nlohmann::json handlers = nlohmann::json::array();
  for (const auto &row : Registrations()) {
    handlers.push_back({{"message", row.message_type},
                        {"handler", row.handler},
                        {"order", row.order},
                        {"async", row.is_async},
                        {"cascades", row.returns_tuple},
                        {"returns", row.result_type},
                        {"lifetime", LifetimeName(row.lifetime)},
                        {"middleware", row.middleware}});
  }

  nlohmann::json middleware = nlohmann::json::array();
  for (const auto &mw : middleware_) {
    nlohmann::json entry = {{"name", mw->name},
                            {"applies_to", mw->applies_to ? mw->applies_to->name() : "*"},
                            {"lifetime", LifetimeName(mw->lifetime)},
                            {"explicit", mw->explicit_only},
                            {"async", mw->is_async()}};
    entry["order"] = mw->order ? nlohmann::json(*mw->order) : nlohmann::json(nullptr);
    std::vector<std::string> phases;
    if (mw->before) phases.push_back("before");
    if (mw->after) phases.push_back("after");
    if (mw->finally) phases.push_back("finally");
    if (mw->execute) phases.push_back("execute");
    entry["phases"] = phases;
    middleware.push_back(std::move(entry));
  }

  nlohmann::json generic = nlohmann::json::array();
  for (const auto &handler : generic_) {
    std::vector<std::string> closes_over;
    for (const auto &closer : handler->closers) {
      closes_over.push_back(closer.message_name);
    }
    generic.push_back({{"name", handler->name},
                       {"family", handler->family_name},
                       {"order", handler->order},
                       {"lifetime", LifetimeName(handler->lifetime)},
                       {"messages", closes_over}});
  }

  return {{"handlers", handlers}, {"middleware", middleware}, {"generic_handlers", generic}};
}

} // namespace dispatch
} // namespace courier
