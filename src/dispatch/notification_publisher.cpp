// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "dispatch/notification_publisher.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace courier {
namespace dispatch {

namespace {

std::exception_ptr RunCaptured(const NotificationPublisher::Invocation &invocation) {
  try {
    invocation();
    return nullptr;
  } catch (...) {
    // Collected and reported by the caller of Publish
    return std::current_exception();
  }
}

std::vector<std::exception_ptr> Compact(std::vector<std::exception_ptr> slots) {
  std::vector<std::exception_ptr> errors;
  for (auto &slot : slots) {
    if (slot) {
      errors.push_back(std::move(slot));
    }
  }
  return errors;
}

// Join state shared by the tasks of one parallel publish
struct FanOut {
  FanOut(size_t count, NotificationPublisher::Completion done)
      : errors(count), remaining(count), on_complete(std::move(done)) {}

  void Finish(size_t index, std::exception_ptr error) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      errors[index] = std::move(error);
    }
    if (remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      std::vector<std::exception_ptr> collected;
      {
        std::lock_guard<std::mutex> lock(mutex);
        collected = std::move(errors);
      }
      on_complete(Compact(std::move(collected)));
    }
  }

  std::mutex mutex;
  std::vector<std::exception_ptr> errors;
  std::atomic<size_t> remaining;
  NotificationPublisher::Completion on_complete;
};

} // namespace

void SequentialPublisher::Publish(std::vector<Invocation> invocations, Completion on_complete) {
  std::vector<std::exception_ptr> errors;
  for (const auto &invocation : invocations) {
    if (auto error = RunCaptured(invocation)) {
      errors.push_back(std::move(error));
    }
  }
  on_complete(std::move(errors));
}

void ParallelPublisher::Publish(std::vector<Invocation> invocations, Completion on_complete) {
  if (invocations.empty()) {
    on_complete({});
    return;
  }
  if (pool_.is_worker_thread()) {
    LOG_PUBLISH_DEBUG("Parallel publish from worker thread, running {} handlers inline",
                      invocations.size());
    SequentialPublisher().Publish(std::move(invocations), std::move(on_complete));
    return;
  }

  auto fan_out = std::make_shared<FanOut>(invocations.size(), std::move(on_complete));
  for (size_t i = 0; i < invocations.size(); ++i) {
    auto invocation = std::make_shared<Invocation>(std::move(invocations[i]));
    try {
      pool_.enqueue([fan_out, invocation, i]() { fan_out->Finish(i, RunCaptured(*invocation)); });
    } catch (const std::runtime_error &e) {
      // Pool full or stopping: the handler still has to be attempted
      LOG_PUBLISH_WARN("Cannot queue publish handler ({}), running inline", e.what());
      fan_out->Finish(i, RunCaptured(*invocation));
    }
  }
}

} // namespace dispatch
} // namespace courier
