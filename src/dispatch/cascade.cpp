// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/cascade.hpp"
#include "dispatch/errors.hpp"
#include "dispatch/result.hpp"
#include "util/logging.hpp"

namespace courier {
namespace dispatch {

std::optional<Value> CascadeResolver::MatchResponse(const Value &candidate,
                                                    const TypeInfo &expected, bool unwrap,
                                                    std::string *failure) {
  if (candidate.IsA(expected)) {
    return candidate;
  }
  const TypeInfo *type = candidate.Type();
  if (type == nullptr || type->result_hooks() == nullptr) {
    return std::nullopt;
  }
  const ResultHooks &hooks = *type->result_hooks();
  const Result<> &result = hooks.as_result(candidate.Get());

  // Result<> -> Result<T>
  const ResultHooks *target_hooks = expected.result_hooks();
  if (hooks.payload_type == nullptr && target_hooks != nullptr &&
      target_hooks->from_result != nullptr) {
    return Value::FromShared(target_hooks->from_result(result), expected);
  }

  // Result<T> -> T
  if (unwrap && hooks.payload_type != nullptr &&
      hooks.payload_type().IsAssignableTo(expected)) {
    if (!result.IsSuccess()) {
      std::string message = std::string("Handler returned a failed result (") +
                            ResultStatusName(result.status()) +
                            (result.message().empty() ? "" : ": " + result.message()) +
                            ") where " + expected.name() + " was requested";
      if (failure == nullptr) {
        throw ResponseTypeMismatchError(message);
      }
      *failure = std::move(message);
      return std::nullopt;
    }
    Value payload = hooks.payload(candidate.shared());
    if (payload.IsA(expected)) {
      return payload;
    }
  }
  return std::nullopt;
}

Value CascadeResolver::Resolve(const Value &raw, const TypeInfo *expected, CascadeMode mode,
                               const PublishFn &publish) const {
  if (!raw.IsTuple()) {
    if (expected == nullptr) {
      return Value();
    }
    if (!raw.HasValue()) {
      throw ResponseTypeMismatchError("Handler returned no value where " + expected->name() +
                                      " was requested");
    }
    if (auto matched = MatchResponse(raw, *expected)) {
      return *matched;
    }
    throw ResponseTypeMismatchError("Handler returned " + raw.TypeName() + " where " +
                                    expected->name() + " was requested");
  }

  Value response;
  bool found = false;
  // First failed Result<T> seen; reported only if no later element matches
  std::string failed_result;
  std::vector<Value> cascaded;
  for (const Value &element : raw.Elements()) {
    if (!element.HasValue()) {
      continue;
    }
    if (!found && expected != nullptr) {
      std::string failure;
      if (auto matched = MatchResponse(element, *expected, true, &failure)) {
        response = *matched;
        found = true;
        continue;
      }
      if (failed_result.empty()) {
        failed_result = std::move(failure);
      }
    }
    cascaded.push_back(element);
  }

  if (expected != nullptr && !found) {
    if (!failed_result.empty()) {
      throw ResponseTypeMismatchError(failed_result);
    }
    throw ResponseTypeMismatchError("Handler returned " + raw.TypeName() +
                                    " with no element matching " + expected->name());
  }

  if (mode == CascadeMode::PublishRemaining) {
    for (const Value &message : cascaded) {
      LOG_DISPATCH_DEBUG("Cascading {}", message.TypeName());
      publish(message);
    }
  }
  return response;
}

} // namespace dispatch
} // namespace courier
