#pragma once

#include <map>
#include <mutex>

#include "internal/storage/storage_adapter.hpp"

namespace practicedb::storage {

/*
  Volatile adapter used by tests and ephemeral deployments.
*/
class MemoryStorageAdapter final : public StorageAdapter {
 public:
  std::optional<document::Value> Get(const std::string& key) override;
  void                           Set(const std::string& key, const document::Value& value) override;
  void                           Delete(const std::string& key) override;
  std::vector<std::string>       Keys(const std::string& prefix = "") override;
  void                           Clear(const std::string& prefix = "") override;

 private:
  std::mutex                             mutex_;
  std::map<std::string, document::Value> values_;
};

} // namespace practicedb::storage
