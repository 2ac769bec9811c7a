#pragma once

#include "analytics_cache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace analytics_cache {

struct CacheConfig {
  Duration default_ttl{5 * 60 * 1000};
  std::size_t max_entries{1000};
  std::uint64_t max_size_bytes{100ULL * 1024 * 1024};
  // Zero disables the background sweeper.
  Duration cleanup_interval{60 * 1000};
  bool enable_metrics{true};
  std::size_t top_keys_limit{10};
  std::size_t worker_threads{4};
};

// Reads default_ttl_ms, max_entries, max_size_bytes, cleanup_interval_ms,
// enable_metrics, top_keys_limit and worker_threads from a JSON object.
// On failure out is left untouched.
bool load_config(const std::string &path, CacheConfig &out,
                 std::string *err = nullptr);
bool parse_config(const std::string &text, CacheConfig &out,
                  std::string *err = nullptr);

} // namespace analytics_cache
