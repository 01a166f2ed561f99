#pragma once

#include <memory>
#include <string>

#include "internal/storage/storage_adapter.hpp"
#include "sqlite_db.hpp"

namespace practicedb::storage::sqlite {

/*
  Durable adapter over one SQLite table:

      kv(key TEXT PRIMARY KEY, value TEXT NOT NULL)

  Values are stored as JSON. Every key is written under key_prefix so
  several applications can share one file; Keys() strips it again.

  Reads fail open (logged, reported absent). Writes throw.
*/
class SqliteStorageAdapter final : public StorageAdapter {
 public:
  SqliteStorageAdapter(std::shared_ptr<SqliteDB> db, std::string key_prefix);

  std::optional<document::Value> Get(const std::string& key) override;
  void                           Set(const std::string& key, const document::Value& value) override;
  void                           Delete(const std::string& key) override;
  std::vector<std::string>       Keys(const std::string& prefix = "") override;
  void                           Clear(const std::string& prefix = "") override;

 private:
  std::string Namespaced(const std::string& key) const;

  std::shared_ptr<SqliteDB> db_;
  std::string               key_prefix_;
};

} // namespace practicedb::storage::sqlite
