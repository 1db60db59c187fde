// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "dispatch/call_context.hpp"
#include "dispatch/descriptors.hpp"
#include "dispatch/instance_cache.hpp"
#include <memory>
#include <string>
#include <vector>

namespace courier {
namespace dispatch {

class HandlerRegistry;

enum class ExecutionMode { Sync, Async };

/**
 * PipelinePlan - ordered participants for one (handler, runtime message type)
 *
 * Computed once and reused for every dispatch of that pair.
 */
struct PipelinePlan {
  const HandlerDescriptor *handler = nullptr;
  const TypeInfo *message_type = nullptr;
  // Outermost first
  std::vector<const MiddlewareDescriptor *> middleware;
  bool has_async = false;
  bool has_finally = false;
  bool has_execute = false;
  // First asynchronous participant, for diagnostics
  std::string async_participant;

  static std::shared_ptr<const PipelinePlan> Build(const HandlerRegistry &registry,
                                                   const HandlerDescriptor &handler,
                                                   const TypeInfo &message_type);
};

struct PipelineOutcome {
  Value result;
  bool short_circuited = false;
};

/**
 * PipelineExecutor - runs one handler wrapped in its middleware
 *
 * Execute phases wrap the core outermost first; each call to Next re-runs
 * the core with fresh per-attempt state. The core runs:
 *   1. Before phases ascending (a short-circuit stops here)
 *   2. the handler
 *   3. After phases descending (skipped on short-circuit or failure)
 *   4. Finally phases descending, always, seeing any failure
 * The original failure is rethrown after the Finally phases ran. Cancellation
 * is checked before each Before phase and before and after the handler.
 */
class PipelineExecutor {
public:
  explicit PipelineExecutor(InstanceCache &instances) : instances_(instances) {}

  // @throws SyncPipelineViolationError when mode is Sync and the plan is async
  PipelineOutcome Run(const PipelinePlan &plan, PipelineState &state, ExecutionMode mode);

private:
  using Instances = std::vector<std::shared_ptr<void>>;

  void RunAttempt(const PipelinePlan &plan, PipelineState &state, const Instances &instances);
  void RunFinally(const PipelinePlan &plan, PipelineState &state, const Instances &instances);

  InstanceCache &instances_;
};

} // namespace dispatch
} // namespace courier
