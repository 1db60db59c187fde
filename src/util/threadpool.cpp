// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"

namespace courier {
namespace util {

namespace {
// Pool owning the current thread (nullptr outside any pool)
thread_local const ThreadPool *t_current_pool = nullptr;
} // namespace

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue_size, std::string name)
    : name_(std::move(name)), max_queue_size_(max_queue_size), stop_(false) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4; // Fallback if hardware_concurrency() fails
    }
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
  LOG_DEBUG("ThreadPool '{}' started with {} workers", name_, num_threads);
}

ThreadPool::~ThreadPool() {
  shutdown();
  wait_for_completion();
}

void ThreadPool::worker_loop(size_t index) {
  t_current_pool = this;
  while (true) {
    std::function<void()> task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || !tasks_.empty();
      });

      if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }

    // packaged_task stores the task's own exception in its future; anything
    // escaping here comes from the wrapper itself
    try {
      task();
      tasks_completed_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception &e) {
      LOG_ERROR("ThreadPool '{}' worker {} caught exception: {}", name_, index, e.what());
    }
  }
}

void ThreadPool::shutdown() {
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    stop_.store(true, std::memory_order_release);
  }
  condition_.notify_all();
}

void ThreadPool::wait_for_completion() {
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

bool ThreadPool::is_worker_thread() const {
  return t_current_pool == this;
}

} // namespace util
} // namespace courier
