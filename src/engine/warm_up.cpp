#include "analytics_cache/warm_up.hpp"

#include <condition_variable>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <utility>

namespace analytics_cache {
namespace {

struct Batch {
  std::mutex mutex;
  std::condition_variable done_cv;
  std::size_t pending{0};
  std::size_t loaded{0};
  std::vector<std::pair<std::string, std::string>> failures;
};

void run_task(CacheStore &store, const WarmUpTask &task, Batch &batch) {
  std::string error;
  bool ok = false;
  try {
    ok = store.set_value(task.key, task.compute(),
                         SetOptions{task.ttl, task.dependencies});
    if (!ok)
      error = "store destroyed";
  } catch (const std::exception &e) {
    error = e.what();
  } catch (...) {
    error = "unknown exception";
  }

  std::lock_guard<std::mutex> lock(batch.mutex);
  if (ok)
    ++batch.loaded;
  else
    batch.failures.emplace_back(task.key, std::move(error));
  if (--batch.pending == 0)
    batch.done_cv.notify_all();
}

} // namespace

WarmUpResult warm_up(CacheStore &store, std::vector<WarmUpTask> tasks,
                     const WarmUpErrorHandler &on_error) {
  auto batch = std::make_shared<Batch>();
  auto shared_tasks =
      std::make_shared<std::vector<WarmUpTask>>(std::move(tasks));
  batch->pending = shared_tasks->size();

  // Called from a worker, the batch runs inline: queued jobs could sit
  // behind the waiting worker forever.
  const bool inline_batch = store.workers().on_worker_thread();
  for (std::size_t i = 0; i < shared_tasks->size(); ++i) {
    auto job = [&store, batch, shared_tasks, i] {
      run_task(store, (*shared_tasks)[i], *batch);
    };
    if (inline_batch || !store.workers().enqueue(job))
      job();
  }

  std::unique_lock<std::mutex> lock(batch->mutex);
  batch->done_cv.wait(lock, [&batch] { return batch->pending == 0; });
  lock.unlock();

  WarmUpResult result;
  result.loaded = batch->loaded;
  result.failed = batch->failures.size();
  for (const auto &[key, message] : batch->failures) {
    result.failed_keys.push_back(key);
    if (on_error)
      on_error(key, message);
    else
      std::cerr << "analytics_cache: warm-up failed for key " << key << ": "
                << message << "\n";
  }
  return result;
}

} // namespace analytics_cache
