#pragma once

#include <string>

namespace practicedb::storage {

/*
  Holds the AES-256 key used by EncryptedStorageAdapter.

  Key files contain the 32 raw key bytes in base64 on a single line.
*/
class KeyManager {
 public:
  // Throws std::invalid_argument unless key is exactly 32 bytes.
  explicit KeyManager(std::string key);

  // Reads the key stored at path. When the file does not exist a fresh key
  // is generated and written there with owner-only permissions.
  static KeyManager LoadOrCreate(const std::string& path);

  // Process-lifetime key; data sealed with it is unreadable after restart.
  static KeyManager Generate();

  const std::string& Key() const {
    return key_;
  }

 private:
  std::string key_;
};

} // namespace practicedb::storage
