#include "analytics_cache/dependency_index.hpp"

namespace analytics_cache {

void DependencyIndex::add(const std::string &key, const TagSet &tags) {
  for (const auto &tag : tags)
    index_[tag].insert(key);
}

void DependencyIndex::remove(const std::string &key, const TagSet &tags) {
  for (const auto &tag : tags)
    unlink(key, tag);
}

void DependencyIndex::replace(const std::string &key, const TagSet &old_tags,
                              const TagSet &new_tags) {
  for (const auto &tag : old_tags) {
    if (!new_tags.contains(tag))
      unlink(key, tag);
  }
  for (const auto &tag : new_tags) {
    if (!old_tags.contains(tag))
      index_[tag].insert(key);
  }
}

std::vector<std::string>
DependencyIndex::keys_for(const std::string &tag) const {
  auto it = index_.find(tag);
  if (it == index_.end())
    return {};
  return {it->second.begin(), it->second.end()};
}

bool DependencyIndex::contains(const std::string &tag,
                               const std::string &key) const {
  auto it = index_.find(tag);
  return it != index_.end() && it->second.contains(key);
}

void DependencyIndex::unlink(const std::string &key, const std::string &tag) {
  auto it = index_.find(tag);
  if (it == index_.end())
    return;
  it->second.erase(key);
  if (it->second.empty())
    index_.erase(it);
}

} // namespace analytics_cache
