#include "document_cache.hpp"

#include <mutex>

namespace practicedb::db {

DocumentCache::DocumentCache(std::chrono::milliseconds ttl) : ttl_(ttl) {
}

std::string DocumentCache::Key(const std::string& collection, const std::string& id) {
  return collection + ":" + id;
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<document::Document> DocumentCache::Get(const std::string& collection, const std::string& id) const {
  std::shared_lock lock(mutex_);

  auto it = cache_.find(Key(collection, id));
  if (it == cache_.end()) return std::nullopt;

  if (util::Now() - it->second.stored_at >= ttl_) return std::nullopt;

  return it->second.doc;
}

// ------------------------------------------------------------
// Put
// ------------------------------------------------------------

void DocumentCache::Put(const std::string& collection, const std::string& id, const document::Document& doc) {
  std::unique_lock lock(mutex_);
  cache_[Key(collection, id)] = Entry{doc, util::Now()};
}

// ------------------------------------------------------------
// Invalidation
// ------------------------------------------------------------

void DocumentCache::Invalidate(const std::string& collection, const std::string& id) {
  std::unique_lock lock(mutex_);
  cache_.erase(Key(collection, id));
}

void DocumentCache::InvalidateCollection(const std::string& collection) {
  std::unique_lock lock(mutex_);

  const auto prefix = collection + ":";
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (it->first.compare(0, prefix.size(), prefix) == 0) {
      it = cache_.erase(it);
    } else {
      ++it;
    }
  }
}

void DocumentCache::Clear() {
  std::unique_lock lock(mutex_);
  cache_.clear();
}

std::size_t DocumentCache::Size() const {
  std::shared_lock lock(mutex_);
  return cache_.size();
}

} // namespace practicedb::db
