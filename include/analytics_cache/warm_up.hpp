#pragma once

#include "analytics_cache/cache_store.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace analytics_cache {

struct WarmUpTask {
  std::string key;
  std::function<Value()> compute;
  std::optional<Duration> ttl;
  std::vector<std::string> dependencies;
};

struct WarmUpResult {
  std::size_t loaded{0};
  std::size_t failed{0};
  std::vector<std::string> failed_keys;
};

using WarmUpErrorHandler =
    std::function<void(const std::string &key, const std::string &message)>;

template <typename Fn>
WarmUpTask make_warm_up_task(std::string key, Fn compute,
                             std::optional<Duration> ttl = std::nullopt,
                             std::vector<std::string> dependencies = {}) {
  return WarmUpTask{std::move(key),
                    [compute = std::move(compute)]() mutable {
                      return make_value(compute());
                    },
                    ttl, std::move(dependencies)};
}

// Runs every task on the store's workers and blocks until all finished.
// A failing task is reported to on_error (logged when none is given) on the
// calling thread and skipped; the rest still populate the store.
WarmUpResult warm_up(CacheStore &store, std::vector<WarmUpTask> tasks,
                     const WarmUpErrorHandler &on_error = {});

} // namespace analytics_cache
