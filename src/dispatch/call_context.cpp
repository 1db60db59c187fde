// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/call_context.hpp"
#include <stdexcept>

namespace courier {
namespace dispatch {

void PipelineState::ResetAttempt() {
  state.clear();
  result = Value();
  short_circuited = false;
  exception = nullptr;
}

Mediator &CallContext::mediator() const {
  if (state_.mediator == nullptr) {
    throw std::logic_error("CallContext has no mediator");
  }
  return *state_.mediator;
}

const Value *CallContext::FindState(const TypeInfo &type) const {
  for (auto it = state_.state.rbegin(); it != state_.state.rend(); ++it) {
    if (it->Type() != nullptr && *it->Type() == type) {
      return &*it;
    }
  }
  for (const auto &value : state_.state) {
    if (value.IsA(type)) {
      return &value;
    }
  }
  return nullptr;
}

void CallContext::AddState(const Value &value) {
  if (value.IsTuple()) {
    for (const auto &element : value.Elements()) {
      AddState(element);
    }
    return;
  }
  if (value.HasValue()) {
    state_.state.push_back(value);
  }
}

} // namespace dispatch
} // namespace courier
