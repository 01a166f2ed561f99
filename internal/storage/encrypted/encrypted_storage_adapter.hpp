#pragma once

#include <string>
#include <vector>

#include "internal/storage/storage_adapter.hpp"
#include "key_manager.hpp"

namespace practicedb::storage {

/*
  Encrypts sensitive values at rest on top of another adapter.

  A key is sensitive when it contains one of the configured collection
  names. Its value is stored as the string "enc:v1:<base64>", where the
  payload is the AES-256-GCM sealed JSON of the original value. Other
  keys pass through untouched, and so do sensitive keys whose stored
  value predates encryption (no envelope).

  A sealed value that fails to authenticate reads as absent.
*/
class EncryptedStorageAdapter final : public StorageAdapter {
 public:
  EncryptedStorageAdapter(StorageAdapterPtr inner, KeyManager keys, std::vector<std::string> sensitive);

  std::optional<document::Value> Get(const std::string& key) override;
  void                           Set(const std::string& key, const document::Value& value) override;
  void                           Delete(const std::string& key) override;
  std::vector<std::string>       Keys(const std::string& prefix = "") override;
  void                           Clear(const std::string& prefix = "") override;

  bool IsSensitive(const std::string& key) const;

 private:
  StorageAdapterPtr        inner_;
  KeyManager               keys_;
  std::vector<std::string> sensitive_;
};

} // namespace practicedb::storage
