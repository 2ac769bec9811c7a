#include "analytics_cache/config.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace analytics_cache {
namespace {

bool extract_u64(const Json &doc, const char *key, std::uint64_t &out) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_number())
    return false;
  if (it->is_number_float()) {
    const double d = it->get<double>();
    // 2^64 is the first double past the integer range.
    if (d <= 0.0)
      out = 0;
    else if (d >= 18446744073709551616.0)
      out = std::numeric_limits<std::uint64_t>::max();
    else
      out = static_cast<std::uint64_t>(d);
    return true;
  }
  if (it->is_number_integer() && it->get<std::int64_t>() < 0) {
    out = 0;
    return true;
  }
  out = it->get<std::uint64_t>();
  return true;
}

bool extract_bool(const Json &doc, const char *key, bool &out) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_boolean())
    return false;
  out = it->get<bool>();
  return true;
}

} // namespace

bool parse_config(const std::string &text, CacheConfig &out,
                  std::string *err) {
  const Json doc = Json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig cfg = out;
  std::uint64_t u;
  bool b;
  if (extract_u64(doc, "default_ttl_ms", u))
    cfg.default_ttl = Duration(static_cast<Duration::rep>(
        std::clamp<std::uint64_t>(u, 1, 365ULL * 24 * 60 * 60 * 1000)));
  if (extract_u64(doc, "max_entries", u))
    cfg.max_entries = static_cast<std::size_t>(
        std::clamp<std::uint64_t>(u, 0, 1ULL << 32));
  if (extract_u64(doc, "max_size_bytes", u))
    cfg.max_size_bytes = std::clamp<std::uint64_t>(u, 0, 1ULL << 40);
  if (extract_u64(doc, "cleanup_interval_ms", u))
    cfg.cleanup_interval = Duration(static_cast<Duration::rep>(
        std::clamp<std::uint64_t>(u, 0, 24ULL * 60 * 60 * 1000)));
  if (extract_bool(doc, "enable_metrics", b))
    cfg.enable_metrics = b;
  if (extract_u64(doc, "top_keys_limit", u))
    cfg.top_keys_limit =
        static_cast<std::size_t>(std::clamp<std::uint64_t>(u, 0, 1000));
  if (extract_u64(doc, "worker_threads", u))
    cfg.worker_threads =
        static_cast<std::size_t>(std::clamp<std::uint64_t>(u, 1, 256));

  out = cfg;
  return true;
}

bool load_config(const std::string &path, CacheConfig &out, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return parse_config(ss.str(), out, err);
}

} // namespace analytics_cache
