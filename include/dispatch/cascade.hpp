// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/value.hpp"
#include <functional>
#include <optional>
#include <string>

namespace courier {
namespace dispatch {

enum class CascadeMode {
  // Publish tuple elements that are not the response
  PublishRemaining,
  // Short-circuited pipelines: extract the response, publish nothing
  ResponseOnly,
};

/**
 * CascadeResolver - turns raw handler output into the caller's response
 *
 * A tuple result supplies the response from its first element assignable to
 * the requested type; every other non-empty element is published, one after
 * the other, through the supplied function. With no requested type (void
 * responses, publish) every non-empty element is published.
 */
class CascadeResolver {
public:
  using PublishFn = std::function<void(const Value &message)>;

  // @throws ResponseTypeMismatchError when no response matches expected
  Value Resolve(const Value &raw, const TypeInfo *expected, CascadeMode mode,
                const PublishFn &publish) const;

  /**
   * Match one candidate against the requested type
   *
   * - assignable candidates match as is
   * - a Result<> requested as Result<T> is converted (status preserved)
   * - when unwrap is set, a Result<T> requested as something T satisfies
   *   yields its payload; a failed Result<T> throws ResponseTypeMismatchError
   *   naming its status, or records that message in *failure and returns
   *   nullopt when failure is given
   */
  static std::optional<Value> MatchResponse(const Value &candidate, const TypeInfo &expected,
                                            bool unwrap = true, std::string *failure = nullptr);
};

} // namespace dispatch
} // namespace courier
