// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/cancellation.hpp"
#include "dispatch/errors.hpp"

namespace courier {
namespace dispatch {

void CancellationToken::ThrowIfCancellationRequested() const {
  if (IsCancellationRequested()) {
    throw CancellationError();
  }
}

} // namespace dispatch
} // namespace courier
