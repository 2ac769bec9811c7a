#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace analytics_cache {

// Recency bookkeeping behind the store's ceilings. The store calls these
// hooks under its own lock, so implementations need no locking.
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  virtual void on_insert(const std::string &key) = 0;
  virtual void on_access(const std::string &key) = 0;
  virtual void on_erase(const std::string &key) = 0;
  virtual std::optional<std::string> pick_victim() const = 0;
  virtual std::size_t tracked() const = 0;
  virtual void clear() = 0;
};

std::unique_ptr<IEvictionPolicy> make_lru_policy();

} // namespace analytics_cache
