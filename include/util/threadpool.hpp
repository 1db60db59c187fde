// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace courier {
namespace util {

/**
 * Thread pool executing asynchronous dispatch work
 *
 * Features:
 * - Automatic thread count based on hardware concurrency
 * - Exception-safe worker threads (exceptions land in the task's future)
 * - Graceful shutdown with pending task completion
 * - Optional queue size limit to prevent memory exhaustion
 * - Worker identification, so callers running on a worker can avoid
 *   blocking on work queued behind them
 *
 * Usage:
 *   ThreadPool pool(4, 0, "dispatch");
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();
 */
class ThreadPool {
public:
  /**
   * @param num_threads Number of worker threads (0 = use hardware concurrency)
   * @param max_queue_size Maximum queued tasks (0 = unlimited)
   * @param name Label used in log records
   */
  explicit ThreadPool(size_t num_threads = 0, size_t max_queue_size = 0,
                      std::string name = "pool");

  // Stops accepting new tasks and waits for queued tasks to complete
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  /**
   * Enqueue a task for execution
   * Returns a future that will contain the result or the thrown exception
   * @throws std::runtime_error if pool is stopped or queue is full
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  // Stop accepting new tasks (pending tasks will still execute)
  void shutdown();

  // Join all workers. Call after shutdown()
  void wait_for_completion();

  // True when the calling thread is one of this pool's workers
  bool is_worker_thread() const;

  size_t size() const { return workers_.size(); }

  size_t pending_tasks() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
  }

  bool is_stopped() const {
    return stop_.load(std::memory_order_acquire);
  }

  size_t tasks_completed() const {
    return tasks_completed_.load(std::memory_order_relaxed);
  }

  const std::string &name() const { return name_; }

private:
  void worker_loop(size_t index);

  std::string name_;
  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> tasks_;
  size_t max_queue_size_;  // 0 = unlimited

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_;

  std::atomic<size_t> tasks_completed_{0};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    if (stop_.load(std::memory_order_acquire))
      throw std::runtime_error("enqueue on stopped ThreadPool '" + name_ + "'");

    if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_)
      throw std::runtime_error("ThreadPool '" + name_ + "' queue full");

    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace courier
