// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <exception>
#include <functional>
#include <vector>

namespace courier {
namespace util {
class ThreadPool;
} // namespace util

namespace dispatch {

/**
 * NotificationPublisher - runs the handler pipelines of one publish
 *
 * Every invocation is attempted regardless of earlier failures. When all have
 * finished, on_complete is called exactly once with the failures in handler
 * order (empty when all succeeded).
 */
class NotificationPublisher {
public:
  using Invocation = std::function<void()>;
  using Completion = std::function<void(std::vector<std::exception_ptr> errors)>;

  virtual ~NotificationPublisher() = default;

  virtual void Publish(std::vector<Invocation> invocations, Completion on_complete) = 0;
};

// Runs invocations one after another on the calling thread
class SequentialPublisher : public NotificationPublisher {
public:
  void Publish(std::vector<Invocation> invocations, Completion on_complete) override;
};

/**
 * Starts every invocation on the worker pool and completes when the last one
 * finishes. Publish returns without waiting.
 *
 * Called from one of the pool's own workers it runs the invocations inline
 * in order instead, so a worker never waits on work queued behind it.
 */
class ParallelPublisher : public NotificationPublisher {
public:
  explicit ParallelPublisher(util::ThreadPool &pool) : pool_(pool) {}

  void Publish(std::vector<Invocation> invocations, Completion on_complete) override;

private:
  util::ThreadPool &pool_;
};

} // namespace dispatch
} // namespace courier
