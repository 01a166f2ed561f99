#include "storage_factory.hpp"

#include <stdexcept>

#include "encrypted/encrypted_storage_adapter.hpp"
#include "internal/db/model/collections.hpp"
#include "internal/observability/logging.hpp"
#include "memory/memory_storage_adapter.hpp"
#if PRACTICEDB_STORAGE_SQLITE
#include "sqlite/sqlite_db.hpp"
#include "sqlite/sqlite_storage_adapter.hpp"
#endif

namespace practicedb::storage {

namespace {

StorageAdapterPtr BuildBackend(const practicedb::runtime::config::StorageConfig& cfg) {
  if (cfg.has_sqlite()) {
#if PRACTICEDB_STORAGE_SQLITE
    const auto& sqlite = cfg.sqlite();
    const auto  path   = sqlite.path().empty() ? std::string("practicedb.sqlite") : sqlite.path();

    auto db = std::make_shared<sqlite::SqliteDB>(path, sqlite.wal_mode());
    PRACTICEDB_LOG_INFO("storage backend selected", {observability::StringField("backend", "sqlite"), observability::StringField("path", path)});
    return std::make_shared<sqlite::SqliteStorageAdapter>(std::move(db), sqlite.key_prefix());
#else
    throw std::runtime_error("sqlite storage requested but not enabled at build time");
#endif
  }

  PRACTICEDB_LOG_INFO("storage backend selected", {observability::StringField("backend", "memory")});
  return std::make_shared<MemoryStorageAdapter>();
}

} // namespace

StorageAdapterPtr StorageFactory::Build(const practicedb::runtime::config::StorageConfig& cfg) {
  auto backend = BuildBackend(cfg);
  if (!cfg.has_encryption()) return backend;

  const auto& encryption = cfg.encryption();
  if (encryption.key_file().empty()) {
    throw std::invalid_argument("storage.encryption.key_file is required");
  }

  std::vector<std::string> sensitive(encryption.collections().begin(), encryption.collections().end());
  if (sensitive.empty()) sensitive = db::SensitiveCollections();
  PRACTICEDB_LOG_INFO("encryption at rest enabled", {observability::StringField("key_file", encryption.key_file()),
                                                     observability::CountField("collections", sensitive.size())});
  return std::make_shared<EncryptedStorageAdapter>(std::move(backend), KeyManager::LoadOrCreate(encryption.key_file()),
                                                   std::move(sensitive));
}

} // namespace practicedb::storage
