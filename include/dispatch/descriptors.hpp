// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/call_context.hpp"
#include "dispatch/service_scope.hpp"
#include "dispatch/type_info.hpp"
#include "dispatch/value.hpp"
#include <climits>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <vector>

namespace courier {
namespace dispatch {

// Continuation handed to Execute middleware; runs the rest of the pipeline
using Next = std::function<Value()>;

// Instance factory for handlers and middleware with Lifetime::Default
using InstanceFactory = std::function<std::shared_ptr<void>(Scope &)>;

constexpr int kDefaultHandlerOrder = INT_MAX;

/**
 * HandlerResult - outcome of a Before phase
 *
 * Continue carries optional state for later phases and the handler;
 * ShortCircuit stops the pipeline and makes value the dispatch result.
 */
class HandlerResult {
public:
  static HandlerResult Continue(Value state = {}) { return HandlerResult(false, std::move(state)); }
  static HandlerResult ShortCircuit(Value value = {}) { return HandlerResult(true, std::move(value)); }
  template <typename T> static HandlerResult ShortCircuit(T &&value) {
    return ShortCircuit(Value::Of(std::forward<T>(value)));
  }

  bool is_short_circuited() const { return short_circuit_; }
  const Value &value() const { return value_; }

private:
  HandlerResult(bool short_circuit, Value value)
      : short_circuit_(short_circuit), value_(std::move(value)) {}

  bool short_circuit_;
  Value value_;
};

enum class ActivationKind {
  None,             // static or free-function participant
  CachedOnce,       // built once per mediator, reused
  ResolveEveryCall, // obtained from the active scope per dispatch
};

const char *ActivationKindName(ActivationKind kind);

struct HandlerDescriptor {
  const TypeInfo *message_type = nullptr;
  // nullptr for function handlers
  const TypeInfo *handler_type = nullptr;
  std::string name;
  // instance is nullptr for ActivationKind::None
  std::function<Value(void *instance, CallContext &ctx)> invoke;
  bool is_async = false;
  int order = kDefaultHandlerOrder;
  Lifetime lifetime = Lifetime::Default;
  bool returns_tuple = false;
  std::string result_type_name;
  InstanceFactory factory;
  // Middleware explicitly requested by this handler
  std::vector<std::type_index> use_middleware;
  size_t slot = 0;
  size_t index = 0;

  ActivationKind activation() const;
};

struct MiddlewareDescriptor {
  std::string name;
  const TypeInfo *middleware_type = nullptr;
  // nullptr applies to every message
  const TypeInfo *applies_to = nullptr;
  std::optional<int> order;
  Lifetime lifetime = Lifetime::Default;
  // Applied only to handlers that request it
  bool explicit_only = false;

  // Absent phases are empty
  std::function<HandlerResult(void *instance, CallContext &ctx)> before;
  std::function<void(void *instance, CallContext &ctx)> after;
  std::function<void(void *instance, CallContext &ctx)> finally;
  std::function<Value(void *instance, CallContext &ctx, const Next &next)> execute;

  bool before_async = false;
  bool after_async = false;
  bool finally_async = false;
  bool execute_async = false;

  InstanceFactory factory;
  size_t slot = 0;
  size_t index = 0;

  bool is_async() const { return before_async || after_async || finally_async || execute_async; }
  bool is_universal() const { return applies_to == nullptr; }
  int effective_order() const { return order.value_or(INT_MAX); }

  // Message type compatible with this middleware's declared message type
  bool Accepts(const TypeInfo &message_type) const;

  // 0 exact, 1 abstract ancestor, 2 concrete ancestor, 3 universal
  int Specificity(const TypeInfo &message_type) const;

  ActivationKind activation() const;
};

/**
 * GenericHandlerDescriptor - one handler template registered for a message
 * template family, e.g. EnvelopeHandler<T> for every listed Envelope<T>
 *
 * Each closer builds the HandlerDescriptor for one closed message type. The
 * registry runs it the first time that type is looked up.
 */
struct GenericHandlerDescriptor {
  struct Closer {
    std::type_index message_type;
    std::string message_name;
    bool default_constructible = false;
    std::function<HandlerDescriptor()> close;
  };

  std::string name;
  // typeid(GenericFamily<F>) of the message template
  std::type_index family = typeid(void);
  std::string family_name;
  int order = kDefaultHandlerOrder;
  Lifetime lifetime = Lifetime::Default;
  std::vector<Closer> closers;
  // Closer i owns instance slot first_slot + i
  size_t first_slot = 0;
  size_t index = 0;
};

} // namespace dispatch
} // namespace courier
