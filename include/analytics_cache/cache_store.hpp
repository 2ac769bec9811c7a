#pragma once

#include "analytics_cache/config.hpp"
#include "analytics_cache/dependency_index.hpp"
#include "analytics_cache/policy.hpp"
#include "analytics_cache/task_pool.hpp"
#include "analytics_cache/types.hpp"
#include "analytics_cache/value.hpp"

#include <any>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <regex>
#include <string>
#include <thread>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace analytics_cache {

struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  // Ceiling evictions plus TTL removals (lazy and swept).
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::uint64_t invalidations{0};
  std::size_t entries{0};
  // Keys held by the eviction policy; equals entries.
  std::size_t tracked{0};
  std::uint64_t size{0};
  double avg_entry_size{0.0};
  double hit_rate{0.0};
  std::vector<std::pair<std::string, std::uint64_t>> top_keys;
};

/**
 * Thread-safe TTL + LRU store with dependency-tag and pattern invalidation.
 *
 * Every structural change (insert, delete, eviction, expiry, invalidation)
 * updates the entry map, the recency policy and the dependency index under
 * one lock. A background sweeper removes expired entries every
 * cleanup_interval. Counters are cumulative: clear() keeps them.
 *
 * After destroy() the store holds nothing, set() returns false, reads miss
 * without touching counters and invalidations return 0.
 */
class CacheStore {
public:
  explicit CacheStore(CacheConfig cfg = {},
                      std::unique_ptr<IEvictionPolicy> policy = nullptr);
  ~CacheStore();

  CacheStore(const CacheStore &) = delete;
  CacheStore &operator=(const CacheStore &) = delete;

  bool set_value(const std::string &key, Value value,
                 const SetOptions &opts = {});
  template <typename T>
  bool set(const std::string &key, T &&value, const SetOptions &opts = {}) {
    if constexpr (std::is_same_v<std::decay_t<T>, Value>)
      return set_value(key, std::forward<T>(value), opts);
    else
      return set_value(key, make_value(std::forward<T>(value)), opts);
  }

  std::optional<std::any> get(const std::string &key);
  // A hit holding another type is reported as absent. Json payloads, as
  // left by deserialize(), are converted when T has a JSON form.
  template <typename T> std::optional<T> get(const std::string &key) {
    auto v = get(key);
    if (!v.has_value())
      return std::nullopt;
    if (auto *typed = std::any_cast<T>(&*v))
      return std::move(*typed);
    if constexpr (detail::json_convertible_v<T>) {
      if (const auto *j = std::any_cast<Json>(&*v))
        return detail::from_json_or_none<T>(*j);
    }
    return std::nullopt;
  }

  bool del(const std::string &key);
  bool has(const std::string &key) const;
  void clear();
  std::vector<std::string> keys() const;
  std::size_t size() const;
  std::uint64_t memory_used() const;

  std::size_t invalidate_by_dependency(const std::string &tag);
  // ECMAScript syntax, matched anywhere in the key. A malformed pattern
  // removes nothing and reports through err.
  std::size_t invalidate_by_pattern(const std::string &pattern,
                                    std::string *err = nullptr);
  std::size_t invalidate_by_pattern(const std::regex &pattern);

  // Drops entries never read since they were stored.
  std::size_t prune_unused();
  std::size_t sweep_expired();

  CacheStats stats() const;
  std::string info() const;

  std::string serialize() const;
  bool deserialize(const std::string &json, std::string *err = nullptr);
  bool save_snapshot(const std::string &path, std::string *err = nullptr) const;
  bool load_snapshot(const std::string &path, std::string *err = nullptr);

  // Single-flight slot claim: returns the live value when one of type
  // `expected` exists, otherwise stores placeholder and reports its
  // generation (0 if nothing was stored). A live Json payload (restored from
  // a snapshot) is converted in place through adopt when given.
  std::optional<std::any> get_or_claim(const std::string &key,
                                       const std::type_info &expected,
                                       Value placeholder,
                                       const SetOptions &opts,
                                       std::uint64_t *generation,
                                       JsonAdopter adopt = nullptr);
  // Deletes key only if it still holds the entry stored as `generation`.
  bool del_generation(const std::string &key, std::uint64_t generation);

  void destroy();
  bool destroyed() const;

  // Expiry heap nodes, stale ones included.
  std::size_t expiration_backlog() const;

  const CacheConfig &config() const { return cfg_; }
  TaskPool &workers() { return *workers_; }

private:
  enum class EraseReason { Delete, Eviction, Expiration, Invalidation };

  struct ExpiryNode {
    TimePoint deadline;
    std::string key;
    std::uint64_t generation;
    bool operator>(const ExpiryNode &other) const {
      return deadline > other.deadline;
    }
  };

  std::uint64_t insert_locked(const std::string &key, Value value,
                              const SetOptions &opts, TimePoint now);
  void erase_locked(const std::string &key, EraseReason reason);
  void evict_until_fit_locked();
  std::size_t erase_keys_locked(const std::vector<std::string> &keys,
                                EraseReason reason);
  void compact_expiry_heap_locked();
  CacheStats stats_locked() const;
  void sweeper_loop();

  CacheConfig cfg_;
  std::unique_ptr<IEvictionPolicy> policy_;
  std::unique_ptr<TaskPool> workers_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  DependencyIndex deps_;
  std::priority_queue<ExpiryNode, std::vector<ExpiryNode>,
                      std::greater<ExpiryNode>>
      expiry_heap_;
  std::uint64_t memory_used_{0};
  std::uint64_t next_generation_{0};
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
  std::uint64_t evictions_{0};
  std::uint64_t expirations_{0};
  std::uint64_t invalidations_{0};
  bool destroyed_{false};

  std::once_flag destroy_once_;
  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool stop_sweeper_{false};
  std::thread sweeper_;
};

} // namespace analytics_cache
