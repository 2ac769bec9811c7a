#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace analytics_cache {

// Fixed set of workers draining a FIFO queue. Tasks must not throw.
class TaskPool {
public:
  explicit TaskPool(std::size_t n);
  ~TaskPool();

  TaskPool(const TaskPool &) = delete;
  TaskPool &operator=(const TaskPool &) = delete;

  // Returns false once stop() has begun; the task is not queued.
  bool enqueue(std::function<void()> fn);

  // Runs every queued task, then joins the workers.
  void stop();

  std::size_t workers() const { return threads_.size(); }
  // True on one of this pool's worker threads. Work that would block on
  // the pool runs inline there instead of being queued.
  bool on_worker_thread() const;

private:
  void run();

  std::vector<std::thread> threads_;
  std::queue<std::function<void()>> q_;
  std::mutex q_mutex_;
  std::condition_variable q_cv_;
  std::atomic<bool> running_{true};
};

} // namespace analytics_cache
