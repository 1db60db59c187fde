// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/cancellation.hpp"
#include "dispatch/value.hpp"
#include <exception>
#include <memory>
#include <utility>
#include <vector>

namespace courier {
namespace dispatch {

class Mediator;
class Scope;
struct HandlerDescriptor;

// Mutable state of one pipeline run. Owned by the executor's caller.
struct PipelineState {
  PipelineState(Value message, const HandlerDescriptor &handler, Scope &scope,
                Mediator *mediator, CancellationToken cancellation)
      : message(std::move(message)), handler(&handler), scope(&scope),
        mediator(mediator), cancellation(std::move(cancellation)) {}

  // Clears per-attempt data before a (re)run of the core pipeline
  void ResetAttempt();

  Value message;
  const HandlerDescriptor *handler;
  Scope *scope;
  Mediator *mediator;
  CancellationToken cancellation;

  std::shared_ptr<void> handler_instance;
  // Before-phase outputs in insertion order
  std::vector<Value> state;
  Value result;
  bool short_circuited = false;
  std::exception_ptr exception;
};

/**
 * CallContext - what handlers and middleware see of the current dispatch
 *
 * Gives access to the message, the active scope, the mediator (for nested
 * dispatch), the cancellation token, values produced by Before phases, and
 * after the handler ran, its result or exception.
 */
class CallContext {
public:
  explicit CallContext(PipelineState &state) : state_(state) {}

  const Value &message() const { return state_.message; }
  template <typename M> const M &Message() const { return state_.message.As<M>(); }

  const HandlerDescriptor &handler() const { return *state_.handler; }
  Scope &scope() const { return *state_.scope; }

  // @throws std::logic_error when the pipeline runs without a mediator
  Mediator &mediator() const;

  const CancellationToken &cancellation() const { return state_.cancellation; }
  void ThrowIfCancellationRequested() const { state_.cancellation.ThrowIfCancellationRequested(); }

  // Handler output (or the short-circuit value); empty before the handler ran
  const Value &result() const { return state_.result; }
  template <typename T> const T *ResultAs() const { return state_.result.TryAs<T>(); }

  // Failure of the current attempt, seen by Finally phases
  const std::exception_ptr &exception() const { return state_.exception; }
  bool short_circuited() const { return state_.short_circuited; }

  /**
   * Look up a value produced by a Before phase
   *
   * An exact type match returns the most recently added value; otherwise the
   * first added value assignable to type is returned. nullptr when none.
   */
  const Value *FindState(const TypeInfo &type) const;

  template <typename T> const T *State() const {
    const Value *value = FindState(TypeInfo::Get<T>());
    return value ? value->TryAs<T>() : nullptr;
  }

  // Store a Before-phase output; tuples are stored element-wise, empty values ignored
  void AddState(const Value &value);

private:
  PipelineState &state_;
};

} // namespace dispatch
} // namespace courier
