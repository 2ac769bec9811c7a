#pragma once

#include <nlohmann/json.hpp>

#include <any>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace analytics_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;
using Json = nlohmann::json;

// Returns the JSON form of a payload, or nullopt when it has none (pending
// computations, non-serializable types).
using SnapshotFn = std::optional<Json> (*)(const std::any &);

// Rebuilds a typed payload from its JSON form, or nullopt when it does not
// fit.
using JsonAdopter = std::optional<std::any> (*)(const Json &);

struct Value {
  std::any data;
  std::size_t size_bytes{0};
  SnapshotFn snapshot{nullptr};
};

struct Entry {
  Value value;
  TimePoint created_at{};
  TimePoint expires_at{};
  TimePoint last_access{};
  std::uint64_t hit_count{0};
  std::uint64_t generation{0};
  std::unordered_set<std::string> dependencies;
};

struct SetOptions {
  std::optional<Duration> ttl;
  std::vector<std::string> dependencies;
};

// ISO-8601 UTC with millisecond precision, e.g. 2024-03-01T12:00:00.000Z.
std::string format_timestamp(TimePoint tp);

} // namespace analytics_cache

namespace nlohmann {
template <> struct adl_serializer<analytics_cache::TimePoint> {
  static void to_json(json &j, const analytics_cache::TimePoint &tp) {
    j = analytics_cache::format_timestamp(tp);
  }
};
} // namespace nlohmann
