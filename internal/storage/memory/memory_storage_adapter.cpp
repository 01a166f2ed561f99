#include "memory_storage_adapter.hpp"

namespace practicedb::storage {

std::optional<document::Value> MemoryStorageAdapter::Get(const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto             it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void MemoryStorageAdapter::Set(const std::string& key, const document::Value& value) {
  std::scoped_lock lock(mutex_);
  values_[key] = value;
}

void MemoryStorageAdapter::Delete(const std::string& key) {
  std::scoped_lock lock(mutex_);
  values_.erase(key);
}

std::vector<std::string> MemoryStorageAdapter::Keys(const std::string& prefix) {
  std::scoped_lock         lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = values_.lower_bound(prefix); it != values_.end(); ++it) {
    if (it->first.compare(0, prefix.size(), prefix) != 0) break;
    keys.push_back(it->first);
  }
  return keys;
}

void MemoryStorageAdapter::Clear(const std::string& prefix) {
  std::scoped_lock lock(mutex_);
  if (prefix.empty()) {
    values_.clear();
    return;
  }
  auto it = values_.lower_bound(prefix);
  while (it != values_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
    it = values_.erase(it);
  }
}

} // namespace practicedb::storage
