#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace analytics_cache {

using TagSet = std::unordered_set<std::string>;

// Reverse index tag -> keys. Empty buckets are dropped so tag_count() only
// reports tags that still reach a key.
class DependencyIndex {
public:
  void add(const std::string &key, const TagSet &tags);
  void remove(const std::string &key, const TagSet &tags);
  // Moves key from old_tags to new_tags, touching only the difference.
  void replace(const std::string &key, const TagSet &old_tags,
               const TagSet &new_tags);

  std::vector<std::string> keys_for(const std::string &tag) const;
  bool contains(const std::string &tag, const std::string &key) const;
  std::size_t tag_count() const { return index_.size(); }
  void clear() { index_.clear(); }

private:
  void unlink(const std::string &key, const std::string &tag);

  std::unordered_map<std::string, std::unordered_set<std::string>> index_;
};

} // namespace analytics_cache
