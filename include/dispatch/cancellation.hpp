// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <memory>

namespace courier {
namespace dispatch {

/**
 * Cooperative cancellation signal observed by dispatch operations
 *
 * A default-constructed token is never cancelled. Tokens are cheap to copy
 * and stay valid after their CancellationSource is destroyed.
 */
class CancellationToken {
public:
  CancellationToken() = default;

  bool IsCancellationRequested() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }
  bool CanBeCancelled() const { return flag_ != nullptr; }

  // @throws CancellationError once cancellation was requested
  void ThrowIfCancellationRequested() const;

  static CancellationToken None() { return CancellationToken(); }

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
      : flag_(std::move(flag)) {}

  std::shared_ptr<const std::atomic<bool>> flag_;
};

class CancellationSource {
public:
  CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void Cancel() { flag_->store(true, std::memory_order_release); }
  bool IsCancellationRequested() const { return flag_->load(std::memory_order_acquire); }
  CancellationToken Token() const { return CancellationToken(flag_); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace dispatch
} // namespace courier
