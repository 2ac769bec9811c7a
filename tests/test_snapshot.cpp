#include "analytics_cache/memoize.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <future>
#include <string>
#include <thread>

using namespace analytics_cache;

namespace {
CacheConfig snapshot_config() {
  CacheConfig cfg;
  cfg.cleanup_interval = Duration(0);
  cfg.worker_threads = 1;
  return cfg;
}

struct Opaque {
  int handle{0};
};
} // namespace

TEST_CASE("serialize captures resolved values, stats and metadata",
          "[snapshot]") {
  CacheStore store(snapshot_config());
  store.set("stats:reddit", Json{{"posts", 10}},
            SetOptions{Duration(60000), {"platform:reddit", "data"}});
  store.set("label", std::string("weekly"));
  store.set("opaque", Opaque{3});
  store.get("label");

  const auto doc = Json::parse(store.serialize());
  REQUIRE(doc.contains("cache"));
  CHECK(doc["cache"]["stats:reddit"]["posts"] == 10);
  CHECK(doc["cache"]["label"] == "weekly");
  CHECK_FALSE(doc["cache"].contains("opaque"));
  CHECK(doc["stats"]["hits"] == 1);
  CHECK(doc["timestamp"].is_string());

  const auto &meta = doc["meta"]["stats:reddit"];
  CHECK(meta["ttl_ms"].get<std::int64_t>() > 0);
  CHECK(meta["ttl_ms"].get<std::int64_t>() <= 60000);
  CHECK(meta["dependencies"] == Json::array({"data", "platform:reddit"}));
}

TEST_CASE("deserialize restores values with their TTL and tags",
          "[snapshot]") {
  CacheStore source(snapshot_config());
  source.set("a", Json{{"n", 1}}, SetOptions{std::nullopt, {"A"}});
  source.set("b", Json::array({1, 2, 3}), SetOptions{Duration(40), {}});
  const auto text = source.serialize();

  CacheStore restored(snapshot_config());
  std::string err;
  REQUIRE(restored.deserialize(text, &err));
  CHECK(restored.get<Json>("a")->at("n") == 1);
  auto b = restored.get<Json>("b");
  REQUIRE(b.has_value());
  CHECK(*b == Json::array({1, 2, 3}));

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  CHECK_FALSE(restored.has("b"));
  CHECK(restored.invalidate_by_dependency("A") == 1);
}

TEST_CASE("snapshots without metadata use the default TTL", "[snapshot]") {
  auto cfg = snapshot_config();
  cfg.default_ttl = Duration(40);
  CacheStore store(cfg);
  REQUIRE(store.deserialize(
      R"({"cache":{"k":{"v":1}},"stats":{},"timestamp":"2024-01-01T00:00:00.000Z"})"));
  CHECK(store.has("k"));
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  CHECK_FALSE(store.has("k"));
}

TEST_CASE("oversized snapshot TTLs keep the entry alive", "[snapshot]") {
  CacheStore store(snapshot_config());
  REQUIRE(store.deserialize(
      R"({"cache":{"k":1},"meta":{"k":{"ttl_ms":9000000000000000000}}})"));
  CHECK(store.has("k"));
  CHECK(store.get<int>("k") == 1);
  CHECK(store.sweep_expired() == 0);

  const auto doc = Json::parse(store.serialize());
  CHECK(doc["meta"]["k"]["ttl_ms"].get<std::int64_t>() > 0);
}

TEST_CASE("restored results warm memoized functions", "[snapshot][memoize]") {
  std::string text;
  {
    CacheStore source(snapshot_config());
    auto square = memoize<int(int)>(source, [](int x) { return x * x; });
    auto cube = memoize_async<int(int)>(source,
                                        [](int x) { return x * x * x; });
    square(5);
    REQUIRE(cube(3).get() == 27);
    text = source.serialize();
  }

  CacheStore restored(snapshot_config());
  REQUIRE(restored.deserialize(text));
  REQUIRE(restored.size() == 2);

  int square_calls = 0;
  auto square = memoize<int(int)>(restored, [&square_calls](int x) {
    ++square_calls;
    return x * x;
  });
  CHECK(square(5) == 25);
  CHECK(square_calls == 0);

  std::atomic<int> cube_calls{0};
  auto cube = memoize_async<int(int)>(restored, [&cube_calls](int x) {
    ++cube_calls;
    return x * x * x;
  });
  CHECK(cube(3).get() == 27);
  CHECK(cube(3).get() == 27);
  CHECK(cube_calls.load() == 0);
  CHECK(restored.size() == 2);
  CHECK(restored.stats().misses == 0);
}

TEST_CASE("malformed snapshots leave the store untouched", "[snapshot]") {
  CacheStore store(snapshot_config());
  store.set("keep", 1);

  std::string err;
  CHECK_FALSE(store.deserialize("{not json", &err));
  CHECK(err == "malformed json");
  CHECK_FALSE(store.deserialize(R"({"cache":[1,2]})", &err));
  CHECK_FALSE(store.deserialize(
      R"({"cache":{"x":1,"y":2},"meta":{"y":{"ttl_ms":"soon"}}})", &err));
  CHECK(err.find("ttl_ms") != std::string::npos);

  CHECK(store.size() == 1);
  CHECK_FALSE(store.has("x"));
  CHECK(store.get<int>("keep") == 1);
}

TEST_CASE("pending async results are left out of snapshots", "[snapshot]") {
  CacheStore store(snapshot_config());
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();
  auto slow = memoize_async<int(int)>(store, [opened](int x) {
    opened.wait();
    return x;
  });

  auto pending = slow(4);
  CHECK(Json::parse(store.serialize())["cache"].empty());
  gate.set_value();
  CHECK(pending.get() == 4);
  CHECK(Json::parse(store.serialize())["cache"].size() == 1);
}

TEST_CASE("snapshot files round-trip through disk", "[snapshot]") {
  const std::string path = "analytics_cache_snapshot_test.json";
  CacheStore store(snapshot_config());
  store.set("trend:7d", Json{{"slope", 0.5}});
  REQUIRE(store.save_snapshot(path));

  CacheStore restored(snapshot_config());
  REQUIRE(restored.load_snapshot(path));
  CHECK(restored.get<Json>("trend:7d")->at("slope") == 0.5);
  std::remove(path.c_str());

  std::string err;
  CHECK_FALSE(restored.load_snapshot("missing_snapshot.json", &err));
  CHECK(err == "snapshot file not found");
}
