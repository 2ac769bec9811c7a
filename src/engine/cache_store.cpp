#include "analytics_cache/cache_store.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace analytics_cache {
namespace {

bool expired(const Entry &e, TimePoint now) { return now >= e.expires_at; }

struct RestoredEntry {
  std::string key;
  Json value;
  SetOptions opts;
};

} // namespace

CacheStore::CacheStore(CacheConfig cfg,
                       std::unique_ptr<IEvictionPolicy> policy)
    : cfg_(std::move(cfg)), policy_(std::move(policy)) {
  if (!policy_)
    policy_ = make_lru_policy();
  workers_ = std::make_unique<TaskPool>(cfg_.worker_threads);
  if (cfg_.cleanup_interval.count() > 0)
    sweeper_ = std::thread([this] { sweeper_loop(); });
}

CacheStore::~CacheStore() { destroy(); }

bool CacheStore::set_value(const std::string &key, Value value,
                           const SetOptions &opts) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (destroyed_)
    return false;
  insert_locked(key, std::move(value), opts, Clock::now());
  evict_until_fit_locked();
  compact_expiry_heap_locked();
  return true;
}

std::optional<std::any> CacheStore::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (destroyed_)
    return std::nullopt;
  auto it = entries_.find(key);
  const auto now = Clock::now();
  if (it == entries_.end()) {
    ++misses_;
    return std::nullopt;
  }
  if (expired(it->second, now)) {
    erase_locked(key, EraseReason::Expiration);
    ++misses_;
    return std::nullopt;
  }
  auto &e = it->second;
  ++e.hit_count;
  e.last_access = now;
  ++hits_;
  policy_->on_access(key);
  return e.value.data;
}

bool CacheStore::del(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!entries_.contains(key))
    return false;
  erase_locked(key, EraseReason::Delete);
  return true;
}

bool CacheStore::has(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  return it != entries_.end() && !expired(it->second, Clock::now());
}

void CacheStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  deps_.clear();
  policy_->clear();
  expiry_heap_ = {};
  memory_used_ = 0;
}

std::vector<std::string> CacheStore::keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[k, _] : entries_)
    out.push_back(k);
  return out;
}

std::size_t CacheStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::uint64_t CacheStore::memory_used() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return memory_used_;
}

std::size_t CacheStore::invalidate_by_dependency(const std::string &tag) {
  std::lock_guard<std::mutex> lock(mutex_);
  return erase_keys_locked(deps_.keys_for(tag), EraseReason::Invalidation);
}

std::size_t CacheStore::invalidate_by_pattern(const std::string &pattern,
                                              std::string *err) {
  std::regex re;
  try {
    re = std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error &e) {
    if (err)
      *err = std::string("invalid pattern: ") + e.what();
    return 0;
  }
  return invalidate_by_pattern(re);
}

std::size_t CacheStore::invalidate_by_pattern(const std::regex &pattern) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> matched;
  for (const auto &[k, _] : entries_) {
    if (std::regex_search(k, pattern))
      matched.push_back(k);
  }
  return erase_keys_locked(matched, EraseReason::Invalidation);
}

std::size_t CacheStore::prune_unused() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> unused;
  for (const auto &[k, e] : entries_) {
    if (e.hit_count == 0)
      unused.push_back(k);
  }
  return erase_keys_locked(unused, EraseReason::Delete);
}

std::size_t CacheStore::sweep_expired() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = Clock::now();
  std::size_t removed = 0;
  while (!expiry_heap_.empty()) {
    const auto &node = expiry_heap_.top();
    if (node.deadline > now)
      break;
    const auto key = node.key;
    const auto gen = node.generation;
    expiry_heap_.pop();
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.generation != gen)
      continue;
    if (expired(it->second, now)) {
      erase_locked(key, EraseReason::Expiration);
      ++removed;
    }
  }
  compact_expiry_heap_locked();
  return removed;
}

CacheStats CacheStore::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_locked();
}

std::string CacheStore::info() const {
  const auto s = stats();
  std::ostringstream os;
  os << "policy_mode:" << policy_->name() << "\n";
  os << "keys:" << s.entries << "\n";
  os << "policy_tracked:" << s.tracked << "\n";
  os << "memory_used_bytes:" << s.size << "\n";
  os << "memory_limit_bytes:" << cfg_.max_size_bytes << "\n";
  os << "max_entries:" << cfg_.max_entries << "\n";
  os << "hits:" << s.hits << "\n";
  os << "misses:" << s.misses << "\n";
  os << "hit_rate:" << s.hit_rate << "\n";
  os << "evictions:" << s.evictions << "\n";
  os << "expirations:" << s.expirations << "\n";
  os << "invalidations:" << s.invalidations << "\n";
  os << "avg_entry_size:" << s.avg_entry_size << "\n";
  os << "topk_hits:";
  for (std::size_t i = 0; i < s.top_keys.size(); ++i) {
    if (i)
      os << ",";
    os << s.top_keys[i].first << ":" << s.top_keys[i].second;
  }
  os << "\n";
  return os.str();
}

std::string CacheStore::serialize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = Clock::now();
  Json cache = Json::object();
  Json meta = Json::object();
  for (const auto &[k, e] : entries_) {
    if (expired(e, now) || e.value.snapshot == nullptr)
      continue;
    auto snap = e.value.snapshot(e.value.data);
    if (!snap.has_value())
      continue;
    std::vector<std::string> tags(e.dependencies.begin(),
                                  e.dependencies.end());
    std::sort(tags.begin(), tags.end());
    cache[k] = std::move(*snap);
    meta[k] = {
        {"ttl_ms",
         std::chrono::duration_cast<Duration>(e.expires_at - now).count()},
        {"dependencies", tags}};
  }
  const auto s = stats_locked();
  Json doc = {{"cache", std::move(cache)},
              {"meta", std::move(meta)},
              {"stats",
               {{"hits", s.hits},
                {"misses", s.misses},
                {"evictions", s.evictions},
                {"expirations", s.expirations},
                {"invalidations", s.invalidations},
                {"entries", s.entries},
                {"size", s.size},
                {"hitRate", s.hit_rate}}},
              {"timestamp", format_timestamp(now)}};
  return doc.dump(-1, ' ', false, Json::error_handler_t::replace);
}

bool CacheStore::deserialize(const std::string &json, std::string *err) {
  auto fail = [err](const std::string &msg) {
    std::cerr << "analytics_cache: snapshot rejected: " << msg << "\n";
    if (err)
      *err = msg;
    return false;
  };

  const Json doc = Json::parse(json, nullptr, false);
  if (doc.is_discarded())
    return fail("malformed json");
  if (!doc.is_object())
    return fail("snapshot is not an object");
  auto cache_it = doc.find("cache");
  if (cache_it == doc.end() || !cache_it->is_object())
    return fail("missing cache object");
  const Json *meta = nullptr;
  if (auto meta_it = doc.find("meta"); meta_it != doc.end()) {
    if (!meta_it->is_object())
      return fail("meta is not an object");
    meta = &*meta_it;
  }

  // Validate everything before touching the store.
  std::vector<RestoredEntry> restored;
  restored.reserve(cache_it->size());
  for (const auto &[key, value] : cache_it->items()) {
    RestoredEntry r{key, value, {}};
    if (meta != nullptr) {
      if (auto m = meta->find(key); m != meta->end()) {
        if (!m->is_object())
          return fail("meta for " + key + " is not an object");
        if (auto ttl = m->find("ttl_ms"); ttl != m->end()) {
          if (!ttl->is_number_integer())
            return fail("ttl_ms for " + key + " is not an integer");
          const auto ms = ttl->get<std::int64_t>();
          if (ms <= 0)
            continue;
          r.opts.ttl = Duration(ms);
        }
        if (auto tags = m->find("dependencies"); tags != m->end()) {
          if (!tags->is_array())
            return fail("dependencies for " + key + " is not an array");
          for (const auto &tag : *tags) {
            if (!tag.is_string())
              return fail("dependency tag for " + key + " is not a string");
            r.opts.dependencies.push_back(tag.get<std::string>());
          }
        }
      }
    }
    restored.push_back(std::move(r));
  }

  for (auto &r : restored)
    set(r.key, std::move(r.value), r.opts);
  return true;
}

bool CacheStore::save_snapshot(const std::string &path,
                               std::string *err) const {
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    std::cerr << "analytics_cache: cannot open " << path << " for writing\n";
    if (err)
      *err = "cannot open snapshot file for writing";
    return false;
  }
  out << serialize();
  out.flush();
  if (!out) {
    if (err)
      *err = "snapshot write failed";
    return false;
  }
  return true;
}

bool CacheStore::load_snapshot(const std::string &path, std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "snapshot file not found";
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  return deserialize(ss.str(), err);
}

std::optional<std::any> CacheStore::get_or_claim(const std::string &key,
                                                 const std::type_info &expected,
                                                 Value placeholder,
                                                 const SetOptions &opts,
                                                 std::uint64_t *generation,
                                                 JsonAdopter adopt) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (generation)
    *generation = 0;
  if (destroyed_)
    return std::nullopt;
  const auto now = Clock::now();
  auto it = entries_.find(key);
  if (it != entries_.end() && !expired(it->second, now) &&
      it->second.value.data.type() == expected) {
    auto &e = it->second;
    ++e.hit_count;
    e.last_access = now;
    ++hits_;
    policy_->on_access(key);
    return e.value.data;
  }
  if (it != entries_.end() && !expired(it->second, now) && adopt != nullptr) {
    if (const auto *j = std::any_cast<Json>(&it->second.value.data)) {
      if (auto adopted = adopt(*j)) {
        auto &e = it->second;
        e.value.data = std::move(*adopted);
        e.value.snapshot = placeholder.snapshot;
        ++e.hit_count;
        e.last_access = now;
        ++hits_;
        policy_->on_access(key);
        return e.value.data;
      }
    }
  }
  if (it != entries_.end() && expired(it->second, now))
    erase_locked(key, EraseReason::Expiration);
  ++misses_;
  const auto gen = insert_locked(key, std::move(placeholder), opts, now);
  evict_until_fit_locked();
  compact_expiry_heap_locked();
  if (generation && entries_.contains(key))
    *generation = gen;
  return std::nullopt;
}

bool CacheStore::del_generation(const std::string &key,
                                std::uint64_t generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.generation != generation)
    return false;
  erase_locked(key, EraseReason::Delete);
  return true;
}

void CacheStore::destroy() {
  std::call_once(destroy_once_, [this] {
    {
      std::lock_guard<std::mutex> lock(sweeper_mutex_);
      stop_sweeper_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable())
      sweeper_.join();
    // Pending memoized computations finish against a live store.
    workers_->stop();

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    deps_.clear();
    policy_->clear();
    expiry_heap_ = {};
    memory_used_ = 0;
    destroyed_ = true;
  });
}

std::size_t CacheStore::expiration_backlog() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return expiry_heap_.size();
}

bool CacheStore::destroyed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return destroyed_;
}

std::uint64_t CacheStore::insert_locked(const std::string &key, Value value,
                                        const SetOptions &opts,
                                        TimePoint now) {
  TagSet tags(opts.dependencies.begin(), opts.dependencies.end());
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    memory_used_ -= it->second.value.size_bytes;
    deps_.replace(key, it->second.dependencies, tags);
  } else {
    deps_.add(key, tags);
  }

  Entry &e = entries_[key];
  e.value = std::move(value);
  e.created_at = now;
  // Deadlines saturate at the clock's range.
  const auto headroom =
      std::chrono::duration_cast<Duration>(TimePoint::max() - now);
  e.expires_at =
      now + std::min(opts.ttl.value_or(cfg_.default_ttl), headroom);
  e.last_access = now;
  e.hit_count = 0;
  e.generation = ++next_generation_;
  e.dependencies = std::move(tags);
  memory_used_ += e.value.size_bytes;
  policy_->on_insert(key);
  expiry_heap_.push({e.expires_at, key, e.generation});
  return e.generation;
}

void CacheStore::erase_locked(const std::string &key, EraseReason reason) {
  auto it = entries_.find(key);
  if (it == entries_.end())
    return;
  memory_used_ -= it->second.value.size_bytes;
  deps_.remove(key, it->second.dependencies);
  policy_->on_erase(key);
  entries_.erase(it);
  switch (reason) {
  case EraseReason::Eviction:
    ++evictions_;
    break;
  case EraseReason::Expiration:
    ++evictions_;
    ++expirations_;
    break;
  case EraseReason::Invalidation:
    ++invalidations_;
    break;
  case EraseReason::Delete:
    break;
  }
}

void CacheStore::evict_until_fit_locked() {
  while (!entries_.empty()) {
    const bool over_count = entries_.size() > cfg_.max_entries;
    // A lone oversized entry is admitted.
    const bool over_size =
        memory_used_ > cfg_.max_size_bytes && entries_.size() > 1;
    if (!over_count && !over_size)
      break;
    auto victim = policy_->pick_victim();
    if (!victim.has_value())
      break;
    erase_locked(*victim, EraseReason::Eviction);
  }
}

std::size_t CacheStore::erase_keys_locked(const std::vector<std::string> &keys,
                                          EraseReason reason) {
  std::size_t removed = 0;
  for (const auto &k : keys) {
    if (!entries_.contains(k))
      continue;
    erase_locked(k, reason);
    ++removed;
  }
  return removed;
}

void CacheStore::compact_expiry_heap_locked() {
  // Replaced and deleted entries leave stale nodes behind.
  if (expiry_heap_.size() <= 2 * entries_.size() + 64)
    return;
  std::vector<ExpiryNode> live;
  live.reserve(entries_.size());
  for (const auto &[k, e] : entries_)
    live.push_back({e.expires_at, k, e.generation});
  expiry_heap_ = decltype(expiry_heap_)(std::greater<ExpiryNode>(),
                                        std::move(live));
}

CacheStats CacheStore::stats_locked() const {
  CacheStats s;
  s.hits = hits_;
  s.misses = misses_;
  s.evictions = evictions_;
  s.expirations = expirations_;
  s.invalidations = invalidations_;
  s.entries = entries_.size();
  s.tracked = policy_->tracked();
  s.size = memory_used_;
  s.avg_entry_size = s.entries == 0 ? 0.0
                                    : static_cast<double>(s.size) /
                                          static_cast<double>(s.entries);
  const auto total = s.hits + s.misses;
  s.hit_rate = total == 0 ? 0.0
                          : static_cast<double>(s.hits) /
                                static_cast<double>(total);
  if (!cfg_.enable_metrics)
    return s;

  std::vector<std::pair<std::string, std::uint64_t>> counts;
  counts.reserve(entries_.size());
  for (const auto &[k, e] : entries_)
    counts.emplace_back(k, e.hit_count);
  const auto n = std::min(cfg_.top_keys_limit, counts.size());
  std::partial_sort(counts.begin(), counts.begin() + n, counts.end(),
                    [](const auto &a, const auto &b) {
                      if (a.second == b.second)
                        return a.first < b.first;
                      return a.second > b.second;
                    });
  counts.resize(n);
  s.top_keys = std::move(counts);
  return s;
}

void CacheStore::sweeper_loop() {
  std::unique_lock<std::mutex> lock(sweeper_mutex_);
  while (!stop_sweeper_) {
    if (sweeper_cv_.wait_for(lock, cfg_.cleanup_interval,
                             [this] { return stop_sweeper_; }))
      break;
    lock.unlock();
    sweep_expired();
    lock.lock();
  }
}

} // namespace analytics_cache
