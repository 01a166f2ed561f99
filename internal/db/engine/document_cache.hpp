#pragma once

#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/document/value.hpp"
#include "internal/util/time.hpp"

namespace practicedb::db {

/*
  Read-through cache keyed "collection:id".

  Entries expire after a fixed TTL regardless of writes; the engine
  invalidates on every mutation it performs. Writes that bypass the
  engine can be served stale until the TTL elapses.
*/
class DocumentCache {
 public:
  explicit DocumentCache(std::chrono::milliseconds ttl);

  std::optional<document::Document> Get(const std::string& collection, const std::string& id) const;
  void                              Put(const std::string& collection, const std::string& id, const document::Document& doc);

  void Invalidate(const std::string& collection, const std::string& id);
  void InvalidateCollection(const std::string& collection);
  void Clear();

  std::size_t Size() const;

 private:
  static std::string Key(const std::string& collection, const std::string& id);

  struct Entry {
    document::Document doc;
    util::TimePoint    stored_at;
  };

  std::chrono::milliseconds ttl_;

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> cache_;
};

} // namespace practicedb::db
