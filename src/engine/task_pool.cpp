#include "analytics_cache/task_pool.hpp"

namespace analytics_cache {
namespace {
thread_local const TaskPool *current_pool = nullptr;
} // namespace

TaskPool::TaskPool(std::size_t n) {
  if (n == 0)
    n = 1;
  threads_.reserve(n);
  for (std::size_t i = 0; i < n; ++i)
    threads_.emplace_back([this] { run(); });
}

TaskPool::~TaskPool() { stop(); }

bool TaskPool::enqueue(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lock(q_mutex_);
    if (!running_)
      return false;
    q_.push(std::move(fn));
  }
  q_cv_.notify_one();
  return true;
}

void TaskPool::stop() {
  {
    std::lock_guard<std::mutex> lock(q_mutex_);
    if (!running_)
      return;
    running_ = false;
  }
  q_cv_.notify_all();
  for (auto &t : threads_) {
    if (t.joinable())
      t.join();
  }
}

bool TaskPool::on_worker_thread() const { return current_pool == this; }

void TaskPool::run() {
  current_pool = this;
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(q_mutex_);
      q_cv_.wait(lock, [this] { return !q_.empty() || !running_; });
      if (q_.empty())
        return;
      task = std::move(q_.front());
      q_.pop();
    }
    task();
  }
}

} // namespace analytics_cache
