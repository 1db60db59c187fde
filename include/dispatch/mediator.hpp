// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/cancellation.hpp"
#include "dispatch/cascade.hpp"
#include "dispatch/config.hpp"
#include "dispatch/handler_registry.hpp"
#include "dispatch/instance_cache.hpp"
#include "dispatch/notification_publisher.hpp"
#include "dispatch/pipeline.hpp"
#include "dispatch/service_scope.hpp"
#include "dispatch/value.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <typeindex>
#include <utility>

namespace courier {
namespace dispatch {

/**
 * Mediator - in-process message dispatch
 *
 * Invoke sends a message to exactly one handler and returns its response.
 * Publish fans a message out to every handler registered for its type or any
 * of its declared ancestors. Both run the handler inside its middleware
 * pipeline, and both resolve cascading messages (tuple results) before they
 * return.
 *
 * Threading:
 * - Invoke and Publish run on the calling thread and reject pipelines with
 *   asynchronous participants (SyncPipelineViolationError).
 * - InvokeAsync and PublishAsync run on the mediator's worker pool. Called
 *   from a worker (nested dispatch from a handler) they run inline and return
 *   a ready future.
 * - When the pool refuses work (max_queue_size reached, or shutting down) the
 *   work runs inline on the calling thread and the returned future is ready.
 *   Parallel publish applies the same rule per handler. A full queue never
 *   throws at the call site.
 * - Scopes are borrowed: the caller keeps the scope alive until the call (or
 *   its future) completes. The mediator must outlive every future it returned.
 *
 * Usage:
 *   Mediator mediator(registry, services);
 *   std::string pong = mediator.Invoke<std::string>(Ping{"x"});
 *   mediator.PublishAsync(OrderShipped{42}).get();
 */
class Mediator {
public:
  Mediator(std::shared_ptr<const HandlerRegistry> registry, Scope &root_scope,
           MediatorConfig config = {});
  ~Mediator();

  Mediator(const Mediator &) = delete;
  Mediator &operator=(const Mediator &) = delete;

  /**
   * Dispatch to the single handler of the message's type
   *
   * @throws HandlerNotFoundError, AmbiguousHandlerError, ConstructionError,
   *         SyncPipelineViolationError, ResponseTypeMismatchError,
   *         CancellationError, or whatever the handler threw
   */
  template <typename R = void, typename M>
  R Invoke(M &&message, Scope &scope, CancellationToken cancellation = {});
  template <typename R = void, typename M> R Invoke(M &&message) {
    return Invoke<R>(std::forward<M>(message), root_scope_);
  }

  template <typename R = void, typename M>
  std::future<R> InvokeAsync(M &&message, Scope &scope, CancellationToken cancellation = {});
  template <typename R = void, typename M> std::future<R> InvokeAsync(M &&message) {
    return InvokeAsync<R>(std::forward<M>(message), root_scope_);
  }

  /**
   * Dispatch to every matching handler, sequentially on the calling thread
   *
   * @throws the single failure as is, or AggregatedHandlerErrors when two or
   *         more handlers failed
   */
  template <typename M>
  void Publish(M &&message, Scope &scope, CancellationToken cancellation = {}) {
    PublishValue(Value::Of(std::forward<M>(message)), scope, cancellation, ExecutionMode::Sync,
                 PublishStrategy::Sequential);
  }
  template <typename M> void Publish(M &&message) {
    Publish(std::forward<M>(message), root_scope_);
  }

  // strategy defaults to the configured publish strategy
  template <typename M>
  std::future<void> PublishAsync(M &&message, Scope &scope, CancellationToken cancellation = {},
                                 std::optional<PublishStrategy> strategy = std::nullopt) {
    return PublishValueAsync(Value::Of(std::forward<M>(message)), scope, cancellation,
                             strategy.value_or(config_.publish_strategy));
  }
  template <typename M> std::future<void> PublishAsync(M &&message) {
    return PublishAsync(std::forward<M>(message), root_scope_);
  }

  // Type-erased entry points; response_type nullptr means no response
  Value InvokeValue(const Value &message, const TypeInfo *response_type, Scope &scope,
                    const CancellationToken &cancellation, ExecutionMode mode);
  void PublishValue(const Value &message, Scope &scope, const CancellationToken &cancellation,
                    ExecutionMode mode, PublishStrategy strategy);
  std::future<void> PublishValueAsync(const Value &message, Scope &scope,
                                      const CancellationToken &cancellation,
                                      PublishStrategy strategy);

  // Log every registration through the registry logger
  void ShowRegisteredHandlers() const;

  const HandlerRegistry &registry() const { return *registry_; }
  const MediatorConfig &config() const { return config_; }
  Scope &root_scope() const { return root_scope_; }
  const util::ThreadPool &pool() const { return *pool_; }

  // Cached pipeline plan for handler and runtime message type
  std::shared_ptr<const PipelinePlan> GetPlan(const HandlerDescriptor &handler,
                                              const TypeInfo &message_type);

private:
  template <typename R> static const TypeInfo *ResponseTypeOf() {
    if constexpr (std::is_void_v<R>) {
      return nullptr;
    } else {
      return &TypeInfo::Get<R>();
    }
  }

  template <typename R> static R ConvertResponse(const Value &response) {
    if constexpr (!std::is_void_v<R>) {
      return response.As<R>();
    }
  }

  // Run work on the pool, or inline when already on one of its workers
  template <typename F> auto RunAsync(F &&work) -> std::future<std::invoke_result_t<F &>>;

  // Start a publish; on_complete receives the collected failures
  void StartPublish(const Value &message, Scope &scope, const CancellationToken &cancellation,
                    ExecutionMode mode, PublishStrategy strategy,
                    NotificationPublisher::Completion on_complete);

  // One published handler: pipeline plus its own cascades
  void RunPublished(const PipelinePlan &plan, const Value &message, Scope &scope,
                    const CancellationToken &cancellation, ExecutionMode mode,
                    PublishStrategy strategy);

  static void ValidateMessage(const Value &message);

  std::shared_ptr<const HandlerRegistry> registry_;
  Scope &root_scope_;
  MediatorConfig config_;
  InstanceCache instances_;
  PipelineExecutor executor_;
  CascadeResolver cascade_;

  std::mutex plans_mutex_;
  std::map<std::pair<size_t, std::type_index>, std::shared_ptr<const PipelinePlan>> plans_;

  SequentialPublisher sequential_;
  std::unique_ptr<ParallelPublisher> parallel_;

  // Last member: destroyed first, so queued work finishes while the rest is alive
  std::unique_ptr<util::ThreadPool> pool_;
};

template <typename F>
auto Mediator::RunAsync(F &&work) -> std::future<std::invoke_result_t<F &>> {
  using Result = std::invoke_result_t<F &>;
  if (!pool_->is_worker_thread()) {
    try {
      return pool_->enqueue(work);
    } catch (const std::runtime_error &e) {
      LOG_DISPATCH_WARN("Cannot queue dispatch ({}), running inline", e.what());
    }
  }
  std::packaged_task<Result()> task(std::forward<F>(work));
  std::future<Result> future = task.get_future();
  task();
  return future;
}

template <typename R, typename M>
R Mediator::Invoke(M &&message, Scope &scope, CancellationToken cancellation) {
  Value response = InvokeValue(Value::Of(std::forward<M>(message)), ResponseTypeOf<R>(), scope,
                               cancellation, ExecutionMode::Sync);
  return ConvertResponse<R>(response);
}

template <typename R, typename M>
std::future<R> Mediator::InvokeAsync(M &&message, Scope &scope, CancellationToken cancellation) {
  Value request = Value::Of(std::forward<M>(message));
  ValidateMessage(request);
  const TypeInfo *response_type = ResponseTypeOf<R>();
  return RunAsync([this, request, response_type, &scope, cancellation]() -> R {
    Value response =
        InvokeValue(request, response_type, scope, cancellation, ExecutionMode::Async);
    return ConvertResponse<R>(response);
  });
}

} // namespace dispatch
} // namespace courier
