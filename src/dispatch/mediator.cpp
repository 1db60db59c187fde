// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/mediator.hpp"
#include "dispatch/errors.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace courier {
namespace dispatch {

namespace {

std::exception_ptr Aggregate(const std::string &message_type,
                             std::vector<std::exception_ptr> errors) {
  if (errors.empty()) {
    return nullptr;
  }
  if (errors.size() == 1) {
    return errors.front();
  }
  return std::make_exception_ptr(AggregatedHandlerErrors(message_type, std::move(errors)));
}

// Settles done once a publish has finished
NotificationPublisher::Completion SettleWhenDone(std::shared_ptr<std::promise<void>> done,
                                                 std::string message_type) {
  return [done = std::move(done),
          message_type = std::move(message_type)](std::vector<std::exception_ptr> errors) {
    if (auto error = Aggregate(message_type, std::move(errors))) {
      done->set_exception(error);
    } else {
      done->set_value();
    }
  };
}

} // namespace

Mediator::Mediator(std::shared_ptr<const HandlerRegistry> registry, Scope &root_scope,
                   MediatorConfig config)
    : registry_(std::move(registry)), root_scope_(root_scope), config_(std::move(config)),
      instances_(registry_ ? registry_->slot_count() : 0), executor_(instances_) {
  if (!registry_) {
    throw std::invalid_argument("Mediator requires a handler registry");
  }
  pool_ = std::make_unique<util::ThreadPool>(config_.worker_threads, config_.max_queue_size,
                                             "dispatch");
  parallel_ = std::make_unique<ParallelPublisher>(*pool_);

  LOG_DISPATCH_INFO("Mediator started: {} handlers, {} middleware, {} workers, {} publish",
                    registry_->handler_count(), registry_->middleware_count(), pool_->size(),
                    PublishStrategyName(config_.publish_strategy));
  if (config_.log_registrations) {
    ShowRegisteredHandlers();
  }
}

Mediator::~Mediator() {
  // Drain queued work before the members it uses go away
  pool_.reset();
  LOG_DISPATCH_DEBUG("Mediator stopped");
}

void Mediator::ValidateMessage(const Value &message) {
  if (!message.HasValue()) {
    throw std::invalid_argument("cannot dispatch an empty message");
  }
  if (message.IsTuple()) {
    throw std::invalid_argument("cannot dispatch a tuple as a message");
  }
}

std::shared_ptr<const PipelinePlan> Mediator::GetPlan(const HandlerDescriptor &handler,
                                                      const TypeInfo &message_type) {
  auto key = std::make_pair(handler.slot, message_type.id());
  {
    std::lock_guard<std::mutex> lock(plans_mutex_);
    auto it = plans_.find(key);
    if (it != plans_.end()) {
      return it->second;
    }
  }

  auto plan = PipelinePlan::Build(*registry_, handler, message_type);

  std::lock_guard<std::mutex> lock(plans_mutex_);
  auto [it, inserted] = plans_.emplace(key, std::move(plan));
  return it->second;
}

Value Mediator::InvokeValue(const Value &message, const TypeInfo *response_type, Scope &scope,
                            const CancellationToken &cancellation, ExecutionMode mode) {
  ValidateMessage(message);
  cancellation.ThrowIfCancellationRequested();

  const TypeInfo &type = *message.Type();
  const auto &handlers = registry_->Lookup(type);
  if (handlers.empty()) {
    LOG_DISPATCH_WARN("No handler for {}", type.name());
    throw HandlerNotFoundError(type.name());
  }
  if (handlers.size() > 1) {
    std::vector<std::string> names;
    for (const auto *handler : handlers) {
      names.push_back(handler->name);
    }
    throw AmbiguousHandlerError(type.name(), std::move(names));
  }

  const HandlerDescriptor &handler = *handlers.front();
  auto plan = GetPlan(handler, type);
  LOG_DISPATCH_TRACE("Invoking {} with {}", handler.name, type.name());

  PipelineState state(message, handler, scope, this, cancellation);
  PipelineOutcome outcome = executor_.Run(*plan, state, mode);

  PublishStrategy cascade_strategy =
      mode == ExecutionMode::Sync ? PublishStrategy::Sequential : config_.publish_strategy;
  return cascade_.Resolve(
      outcome.result, response_type,
      outcome.short_circuited ? CascadeMode::ResponseOnly : CascadeMode::PublishRemaining,
      [&](const Value &cascaded) {
        PublishValue(cascaded, scope, cancellation, mode, cascade_strategy);
      });
}

void Mediator::RunPublished(const PipelinePlan &plan, const Value &message, Scope &scope,
                            const CancellationToken &cancellation, ExecutionMode mode,
                            PublishStrategy strategy) {
  PipelineState state(message, *plan.handler, scope, this, cancellation);
  PipelineOutcome outcome = executor_.Run(plan, state, mode);
  cascade_.Resolve(
      outcome.result, nullptr,
      outcome.short_circuited ? CascadeMode::ResponseOnly : CascadeMode::PublishRemaining,
      [&](const Value &cascaded) { PublishValue(cascaded, scope, cancellation, mode, strategy); });
}

void Mediator::StartPublish(const Value &message, Scope &scope,
                            const CancellationToken &cancellation, ExecutionMode mode,
                            PublishStrategy strategy,
                            NotificationPublisher::Completion on_complete) {
  ValidateMessage(message);
  cancellation.ThrowIfCancellationRequested();

  const TypeInfo &type = *message.Type();
  auto handlers = registry_->LookupForPublish(type);
  if (handlers.empty()) {
    LOG_PUBLISH_DEBUG("No handlers for {}", type.name());
    on_complete({});
    return;
  }

  std::vector<std::shared_ptr<const PipelinePlan>> plans;
  plans.reserve(handlers.size());
  for (const auto *handler : handlers) {
    plans.push_back(GetPlan(*handler, type));
    if (mode == ExecutionMode::Sync && plans.back()->has_async) {
      throw SyncPipelineViolationError(type.name(), plans.back()->async_participant);
    }
  }

  std::vector<NotificationPublisher::Invocation> invocations;
  invocations.reserve(plans.size());
  for (const auto &plan : plans) {
    invocations.push_back([this, plan, message, &scope, cancellation, mode, strategy]() {
      RunPublished(*plan, message, scope, cancellation, mode, strategy);
    });
  }

  LOG_PUBLISH_DEBUG("Publishing {} to {} handlers ({})", type.name(), invocations.size(),
                    mode == ExecutionMode::Sync ? "sync" : PublishStrategyName(strategy));

  NotificationPublisher &publisher =
      (mode == ExecutionMode::Async && strategy == PublishStrategy::Parallel)
          ? static_cast<NotificationPublisher &>(*parallel_)
          : static_cast<NotificationPublisher &>(sequential_);
  publisher.Publish(std::move(invocations), std::move(on_complete));
}

void Mediator::PublishValue(const Value &message, Scope &scope,
                            const CancellationToken &cancellation, ExecutionMode mode,
                            PublishStrategy strategy) {
  // Shared: the completion may still be returning on a worker when get() wakes
  auto done = std::make_shared<std::promise<void>>();
  std::future<void> finished = done->get_future();
  StartPublish(message, scope, cancellation, mode, strategy,
               SettleWhenDone(done, message.TypeName()));
  finished.get();
}

std::future<void> Mediator::PublishValueAsync(const Value &message, Scope &scope,
                                              const CancellationToken &cancellation,
                                              PublishStrategy strategy) {
  ValidateMessage(message);

  if (strategy == PublishStrategy::Sequential) {
    return RunAsync([this, message, &scope, cancellation]() {
      PublishValue(message, scope, cancellation, ExecutionMode::Async,
                   PublishStrategy::Sequential);
    });
  }

  // Parallel: fan out from here, complete from whichever worker finishes last
  auto done = std::make_shared<std::promise<void>>();
  std::future<void> finished = done->get_future();
  try {
    StartPublish(message, scope, cancellation, ExecutionMode::Async, strategy,
                 SettleWhenDone(done, message.TypeName()));
  } catch (...) {
    // Lookup and planning failures surface through the future, like handler failures
    done->set_exception(std::current_exception());
  }
  return finished;
}

void Mediator::ShowRegisteredHandlers() const {
  auto rows = registry_->Registrations();
  LOG_REGISTRY_INFO("{} registered handlers:", rows.size());
  for (const auto &row : rows) {
    std::string middleware;
    for (const auto &name : row.middleware) {
      middleware += middleware.empty() ? name : ", " + name;
    }
    LOG_REGISTRY_INFO("  {} -> {} (order {}, {}, {}{}{})", row.message_type, row.handler,
                      row.order == kDefaultHandlerOrder ? std::string("default")
                                                        : std::to_string(row.order),
                      row.is_async ? "async" : "sync", LifetimeName(row.lifetime),
                      middleware.empty() ? "" : "; middleware: ", middleware);
  }
  for (const auto &generic : registry_->generic_handlers()) {
    LOG_REGISTRY_INFO("  {}<*> -> {} ({} closed types, {})", generic->family_name, generic->name,
                      generic->closers.size(), LifetimeName(generic->lifetime));
  }
}

} // namespace dispatch
} // namespace courier
