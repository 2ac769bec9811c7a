#include "analytics_cache/policy.hpp"

#include <list>
#include <unordered_map>

namespace analytics_cache {
namespace {

class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }

  void on_insert(const std::string &key) override { touch(key); }
  void on_access(const std::string &key) override { touch(key); }

  void on_erase(const std::string &key) override {
    auto it = index_.find(key);
    if (it == index_.end())
      return;
    order_.erase(it->second);
    index_.erase(it);
  }

  std::optional<std::string> pick_victim() const override {
    if (order_.empty())
      return std::nullopt;
    return order_.back();
  }

  std::size_t tracked() const override { return order_.size(); }

  void clear() override {
    order_.clear();
    index_.clear();
  }

private:
  // Front is most recently used.
  void touch(const std::string &key) {
    auto it = index_.find(key);
    if (it != index_.end()) {
      order_.splice(order_.begin(), order_, it->second);
      return;
    }
    order_.push_front(key);
    index_[key] = order_.begin();
  }

  std::list<std::string> order_;
  std::unordered_map<std::string, std::list<std::string>::iterator> index_;
};

} // namespace

std::unique_ptr<IEvictionPolicy> make_lru_policy() {
  return std::make_unique<LruPolicy>();
}

} // namespace analytics_cache
