// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/pipeline.hpp"
#include "dispatch/errors.hpp"
#include "dispatch/handler_registry.hpp"
#include "util/logging.hpp"

namespace courier {
namespace dispatch {

std::shared_ptr<const PipelinePlan> PipelinePlan::Build(const HandlerRegistry &registry,
                                                        const HandlerDescriptor &handler,
                                                        const TypeInfo &message_type) {
  auto plan = std::make_shared<PipelinePlan>();
  plan->handler = &handler;
  plan->message_type = &message_type;
  plan->middleware = registry.MiddlewareFor(handler, message_type);

  if (handler.is_async) {
    plan->has_async = true;
    plan->async_participant = handler.name;
  }
  for (const auto *mw : plan->middleware) {
    if (mw->is_async() && !plan->has_async) {
      plan->has_async = true;
      plan->async_participant = mw->name;
    }
    plan->has_finally = plan->has_finally || static_cast<bool>(mw->finally);
    plan->has_execute = plan->has_execute || static_cast<bool>(mw->execute);
  }

  LOG_PIPELINE_DEBUG("Planned {} for {}: {} middleware{}", handler.name, message_type.name(),
                     plan->middleware.size(), plan->has_async ? " (async)" : "");
  return plan;
}

PipelineOutcome PipelineExecutor::Run(const PipelinePlan &plan, PipelineState &state,
                                      ExecutionMode mode) {
  if (mode == ExecutionMode::Sync && plan.has_async) {
    throw SyncPipelineViolationError(plan.message_type->name(), plan.async_participant);
  }

  Instances instances;
  instances.reserve(plan.middleware.size());
  for (const auto *mw : plan.middleware) {
    instances.push_back(instances_.AcquireMiddleware(*mw, *state.scope));
  }

  LOG_PIPELINE_DEBUG("Processing message {} with {}", plan.message_type->name(),
                     plan.handler->name);

  if (!plan.has_execute) {
    RunAttempt(plan, state, instances);
    LOG_PIPELINE_DEBUG("Completed message {}", plan.message_type->name());
    return {state.result, state.short_circuited};
  }

  Next chain = [this, &plan, &state, &instances]() -> Value {
    RunAttempt(plan, state, instances);
    return state.result;
  };
  for (size_t i = plan.middleware.size(); i-- > 0;) {
    const MiddlewareDescriptor *mw = plan.middleware[i];
    if (!mw->execute) {
      continue;
    }
    void *instance = instances[i].get();
    chain = [mw, instance, &state, next = std::move(chain)]() -> Value {
      CallContext ctx(state);
      return mw->execute(instance, ctx, next);
    };
  }

  Value result = chain();
  LOG_PIPELINE_DEBUG("Completed message {}", plan.message_type->name());
  return {result, state.short_circuited};
}

void PipelineExecutor::RunAttempt(const PipelinePlan &plan, PipelineState &state,
                                  const Instances &instances) {
  state.ResetAttempt();
  CallContext ctx(state);
  const HandlerDescriptor &handler = *plan.handler;

  try {
    for (size_t i = 0; i < plan.middleware.size(); ++i) {
      const MiddlewareDescriptor *mw = plan.middleware[i];
      if (!mw->before) {
        continue;
      }
      state.cancellation.ThrowIfCancellationRequested();
      HandlerResult outcome = mw->before(instances[i].get(), ctx);
      if (outcome.is_short_circuited()) {
        LOG_PIPELINE_DEBUG("Short-circuited message {} in {}", plan.message_type->name(),
                           mw->name);
        state.result = outcome.value();
        state.short_circuited = true;
        break;
      }
      ctx.AddState(outcome.value());
    }

    if (!state.short_circuited) {
      state.cancellation.ThrowIfCancellationRequested();
      if (!state.handler_instance && handler.activation() != ActivationKind::None) {
        state.handler_instance = instances_.AcquireHandler(handler, *state.scope);
      }
      state.result = handler.invoke(state.handler_instance.get(), ctx);
      state.cancellation.ThrowIfCancellationRequested();

      for (size_t i = plan.middleware.size(); i-- > 0;) {
        const MiddlewareDescriptor *mw = plan.middleware[i];
        if (mw->after) {
          mw->after(instances[i].get(), ctx);
        }
      }
    }
  } catch (...) {
    // Rethrown below once Finally phases have seen it
    state.exception = std::current_exception();
  }

  if (plan.has_finally) {
    RunFinally(plan, state, instances);
  }
  if (state.exception) {
    std::rethrow_exception(state.exception);
  }
}

void PipelineExecutor::RunFinally(const PipelinePlan &plan, PipelineState &state,
                                  const Instances &instances) {
  CallContext ctx(state);
  std::exception_ptr first_failure;

  for (size_t i = plan.middleware.size(); i-- > 0;) {
    const MiddlewareDescriptor *mw = plan.middleware[i];
    if (!mw->finally) {
      continue;
    }
    try {
      mw->finally(instances[i].get(), ctx);
    } catch (...) {
      std::exception_ptr failure = std::current_exception();
      if (state.exception) {
        LOG_PIPELINE_ERROR("Finally phase of {} failed while {} was failing: {} (keeping original: {})",
                           mw->name, plan.handler->name, DescribeException(failure),
                           DescribeException(state.exception));
      } else if (first_failure) {
        LOG_PIPELINE_ERROR("Finally phase of {} failed after an earlier Finally failure: {}",
                           mw->name, DescribeException(failure));
      } else {
        first_failure = failure;
      }
    }
  }

  if (!state.exception && first_failure) {
    state.exception = first_failure;
  }
}

} // namespace dispatch
} // namespace courier
