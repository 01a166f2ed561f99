#include "key_manager.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "cipher.hpp"
#include "internal/observability/logging.hpp"

namespace practicedb::storage {

namespace fs = std::filesystem;

KeyManager::KeyManager(std::string key) : key_(std::move(key)) {
  if (key_.size() != crypto::kKeySize) {
    throw std::invalid_argument("encryption key must be " + std::to_string(crypto::kKeySize) + " bytes, got " +
                                std::to_string(key_.size()));
  }
}

KeyManager KeyManager::Generate() {
  return KeyManager(crypto::RandomBytes(crypto::kKeySize));
}

KeyManager KeyManager::LoadOrCreate(const std::string& path) {
  if (fs::exists(path)) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot read encryption key file: " + path);

    std::string encoded;
    std::getline(in, encoded);
    try {
      return KeyManager(crypto::Base64Decode(encoded));
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("invalid encryption key file " + path + ": " + e.what());
    }
  }

  auto key = Generate();
  {
    std::ofstream out(path, std::ios::trunc);
    if (!out) throw std::runtime_error("cannot create encryption key file: " + path);
    out << crypto::Base64Encode(key.Key()) << "\n";
    if (!out.flush()) throw std::runtime_error("cannot write encryption key file: " + path);
  }

  std::error_code ec;
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  if (ec) {
    PRACTICEDB_LOG_WARN("cannot restrict key file permissions",
                        {observability::StringField("path", path), observability::StringField("error", ec.message())});
  }

  PRACTICEDB_LOG_INFO("generated encryption key", {observability::StringField("path", path)});
  return key;
}

} // namespace practicedb::storage
