#include "analytics_cache/memoize.hpp"
#include "analytics_cache/warm_up.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace analytics_cache;

namespace {
CacheConfig warm_config() {
  CacheConfig cfg;
  cfg.cleanup_interval = Duration(0);
  cfg.worker_threads = 4;
  return cfg;
}
} // namespace

TEST_CASE("warm-up loads every successful task", "[warmup]") {
  CacheStore store(warm_config());
  std::vector<WarmUpTask> tasks;
  tasks.push_back(make_warm_up_task(
      "stats:reddit", [] { return Json{{"posts", 120}}; }, std::nullopt,
      {"platform:reddit", "data"}));
  tasks.push_back(make_warm_up_task(
      "stats:hackernews", [] { return Json{{"posts", 80}}; }, Duration(60000),
      {"platform:hackernews", "data"}));
  tasks.push_back(make_warm_up_task("label", [] { return std::string("ok"); }));

  const auto result = warm_up(store, std::move(tasks));
  CHECK(result.loaded == 3);
  CHECK(result.failed == 0);
  CHECK(store.get<Json>("stats:reddit")->at("posts") == 120);
  CHECK(store.get<std::string>("label") == "ok");
  CHECK(store.invalidate_by_dependency("data") == 2);
}

TEST_CASE("one failing task does not stop the batch", "[warmup]") {
  CacheStore store(warm_config());
  std::vector<WarmUpTask> tasks;
  tasks.push_back(make_warm_up_task("good:1", [] { return 1; }));
  tasks.push_back(make_warm_up_task("bad", []() -> int {
    throw std::runtime_error("query failed");
  }));
  tasks.push_back(make_warm_up_task("good:2", [] { return 2; }));
  tasks.push_back(WarmUpTask{"empty", {}, std::nullopt, {}});

  std::vector<std::string> reported;
  std::vector<std::string> messages;
  const auto result =
      warm_up(store, std::move(tasks),
              [&](const std::string &key, const std::string &message) {
                reported.push_back(key);
                messages.push_back(message);
              });

  CHECK(result.loaded == 2);
  CHECK(result.failed == 2);
  std::sort(reported.begin(), reported.end());
  CHECK(reported == std::vector<std::string>{"bad", "empty"});
  CHECK(std::find(messages.begin(), messages.end(), "query failed") !=
        messages.end());
  CHECK(store.has("good:1"));
  CHECK(store.has("good:2"));
  CHECK_FALSE(store.has("bad"));
}

TEST_CASE("warm-up tasks run concurrently", "[warmup]") {
  CacheStore store(warm_config());
  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::vector<WarmUpTask> tasks;
  for (int i = 0; i < 4; ++i) {
    tasks.push_back(make_warm_up_task("slow:" + std::to_string(i), [&, i] {
      const int now = ++running;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      --running;
      return i;
    }));
  }
  const auto result = warm_up(store, std::move(tasks));
  CHECK(result.loaded == 4);
  CHECK(peak.load() >= 2);
}

TEST_CASE("an empty batch returns immediately", "[warmup]") {
  CacheStore store(warm_config());
  const auto result = warm_up(store, {});
  CHECK(result.loaded == 0);
  CHECK(result.failed == 0);
}

TEST_CASE("warm-up started from a worker task runs inline", "[warmup]") {
  auto cfg = warm_config();
  cfg.worker_threads = 1;
  CacheStore store(cfg);
  auto reload = memoize_async<int(int)>(store, [&store](int n) {
    std::vector<WarmUpTask> tasks;
    for (int i = 0; i < n; ++i)
      tasks.push_back(
          make_warm_up_task("nested:" + std::to_string(i), [i] { return i; }));
    return static_cast<int>(warm_up(store, std::move(tasks)).loaded);
  });

  CHECK(reload(3).get() == 3);
  CHECK(store.get<int>("nested:2") == 2);
}
