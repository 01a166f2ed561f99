#include "internal/storage/encrypted/encrypted_storage_adapter.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/engine/database_engine.hpp"
#include "internal/db/model/collections.hpp"
#include "internal/storage/encrypted/cipher.hpp"
#include "internal/storage/memory/memory_storage_adapter.hpp"
#include "internal/storage/storage_factory.hpp"

namespace {

using practicedb::document::ParseDocument;
using practicedb::document::StringValue;
using practicedb::document::StructValue;
using practicedb::document::ValueEquals;
using practicedb::storage::EncryptedStorageAdapter;
using practicedb::storage::KeyManager;
using practicedb::storage::MemoryStorageAdapter;
namespace c      = practicedb::db::collections;
namespace crypto = practicedb::storage::crypto;

constexpr const char* kEnvelope = "enc:v1:";

std::shared_ptr<EncryptedStorageAdapter> Wrap(const std::shared_ptr<MemoryStorageAdapter>& inner, const KeyManager& keys) {
  return std::make_shared<EncryptedStorageAdapter>(inner, keys, practicedb::db::SensitiveCollections());
}

std::string TempPath(const std::string& name) {
  return (std::filesystem::temp_directory_path() /
          ("practicedb_" + name + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count())))
      .string();
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestSensitiveKeysAreSealed() {
  auto inner   = std::make_shared<MemoryStorageAdapter>();
  auto storage = Wrap(inner, KeyManager::Generate());

  const auto patient = StructValue(ParseDocument(R"({"id": "p1", "mrn": "MRN-7731", "nationalId": "1029384756"})"));
  storage->Set(c::kPatients, patient);

  const auto raw = inner->Get(c::kPatients);
  assert(raw && raw->has_string_value());
  assert(raw->string_value().rfind(kEnvelope, 0) == 0);
  assert(raw->string_value().find("MRN-7731") == std::string::npos);

  const auto read = storage->Get(c::kPatients);
  assert(read && ValueEquals(*read, patient));
}

void TestOtherKeysPassThrough() {
  auto inner   = std::make_shared<MemoryStorageAdapter>();
  auto storage = Wrap(inner, KeyManager::Generate());

  const auto user = StructValue(ParseDocument(R"({"id": "u1", "name": "Reception"})"));
  storage->Set(c::kUsers, user);
  storage->Set(c::kMetadata, StringValue("meta"));

  assert(!storage->IsSensitive(c::kUsers));
  assert(storage->IsSensitive("practicedb_db_claims"));
  assert(ValueEquals(*inner->Get(c::kUsers), user));
  assert(inner->Get(c::kMetadata)->string_value() == "meta");
  assert(ValueEquals(*storage->Get(c::kUsers), user));
}

void TestUnreadableSealedValuesReadAsAbsent() {
  auto inner = std::make_shared<MemoryStorageAdapter>();
  Wrap(inner, KeyManager::Generate())->Set(c::kClaims, StringValue("claim"));

  // Different key.
  assert(!Wrap(inner, KeyManager::Generate())->Get(c::kClaims).has_value());

  // Flipped ciphertext byte fails GCM authentication.
  const auto keys    = KeyManager::Generate();
  auto       storage = Wrap(inner, keys);
  storage->Set(c::kLabResults, StringValue("result"));
  auto sealed = crypto::Base64Decode(inner->Get(c::kLabResults)->string_value().substr(7));
  sealed[crypto::kIvSize] ^= 0x01;
  inner->Set(c::kLabResults, StringValue(std::string(kEnvelope) + crypto::Base64Encode(sealed)));
  assert(!storage->Get(c::kLabResults).has_value());

  // Values written before encryption was enabled are returned as stored.
  inner->Set(c::kMedicalRecords, StringValue("legacy"));
  assert(storage->Get(c::kMedicalRecords)->string_value() == "legacy");
}

void TestEngineStoresPatientsEncrypted() {
  auto inner  = std::make_shared<MemoryStorageAdapter>();
  auto engine = std::make_shared<practicedb::db::DatabaseEngine>(Wrap(inner, KeyManager::Generate()));

  engine->Create(c::kPatients, ParseDocument(R"({"id": "p1", "mrn": "MRN-0042", "firstName": "Noura"})"));
  engine->Create(c::kUsers, ParseDocument(R"({"id": "u1", "email": "desk@clinic.example"})"));

  assert(inner->Get(c::kPatients)->string_value().rfind(kEnvelope, 0) == 0);
  assert(inner->Get(c::kUsers)->has_list_value());

  const auto patient = engine->Get(c::kPatients, "p1");
  assert(patient && *practicedb::document::StringField(*patient, "mrn") == "MRN-0042");
}

void TestKeyFileIsCreatedOnceAndReused() {
  const auto path = TempPath("key");

  const auto first  = KeyManager::LoadOrCreate(path);
  const auto second = KeyManager::LoadOrCreate(path);
  assert(first.Key().size() == crypto::kKeySize);
  assert(first.Key() == second.Key());

  const auto perms = std::filesystem::status(path).permissions();
  assert((perms & std::filesystem::perms::group_read) == std::filesystem::perms::none);
  assert((perms & std::filesystem::perms::others_read) == std::filesystem::perms::none);

  {
    std::ofstream out(path, std::ios::trunc);
    out << crypto::Base64Encode("too short") << "\n";
  }
  assert(Throws<std::runtime_error>([&] { KeyManager::LoadOrCreate(path); }));
  std::filesystem::remove(path);

  assert(Throws<std::invalid_argument>([] { (void)KeyManager(std::string(16, 'k')); }));
}

void TestBase64() {
  assert(crypto::Base64Encode("") == "");
  assert(crypto::Base64Encode("f") == "Zg==");
  assert(crypto::Base64Encode("fo") == "Zm8=");
  assert(crypto::Base64Encode("foo") == "Zm9v");
  assert(crypto::Base64Decode("Zg==") == "f");
  assert(crypto::Base64Decode("Zm8=") == "fo");
  assert(crypto::Base64Decode("Zm9v") == "foo");
  assert(Throws<std::invalid_argument>([] { crypto::Base64Decode("Zm9"); }));
}

void TestFactoryWrapsBackend() {
  const auto key_file = TempPath("factory_key");

  practicedb::runtime::config::StorageConfig config;
  config.mutable_memory();
  config.mutable_encryption()->set_key_file(key_file);

  auto storage = practicedb::storage::StorageFactory::Build(config);
  auto wrapped = std::dynamic_pointer_cast<EncryptedStorageAdapter>(storage);
  assert(wrapped != nullptr);
  assert(wrapped->IsSensitive(c::kTelemedicineSessions));
  assert(std::filesystem::exists(key_file));
  std::filesystem::remove(key_file);
}

} // namespace

int main() {
  TestSensitiveKeysAreSealed();
  TestOtherKeysPassThrough();
  TestUnreadableSealedValuesReadAsAbsent();
  TestEngineStoresPatientsEncrypted();
  TestKeyFileIsCreatedOnceAndReused();
  TestBase64();
  TestFactoryWrapsBackend();

  std::cout << "practicedb_unit_encrypted_storage: pass\n";
  return 0;
}
