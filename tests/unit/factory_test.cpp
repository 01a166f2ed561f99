#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/model/collections.hpp"
#include "internal/storage/memory/memory_storage_adapter.hpp"
#include "internal/storage/storage_factory.hpp"

namespace {

using practicedb::config::ConfigLoader;
using practicedb::storage::StorageFactory;
namespace c   = practicedb::db::collections;
namespace cfg = practicedb::runtime::config;

class OfflineHttpClient final : public practicedb::sync::HttpClient {
 public:
  practicedb::sync::HttpResponse Send(const practicedb::sync::HttpRequest&) override {
    throw std::runtime_error("offline");
  }
};

void TestEmptyStorageConfigSelectsMemory() {
  cfg::StorageConfig config;
  auto               storage = StorageFactory::Build(config);
  assert(std::dynamic_pointer_cast<practicedb::storage::MemoryStorageAdapter>(storage) != nullptr);
}

#if PRACTICEDB_STORAGE_SQLITE
void TestSqliteConfigPersistsAcrossBuilds() {
  const auto path = (std::filesystem::temp_directory_path() /
                     ("practicedb_factory_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".db"))
                        .string();

  auto config = ConfigLoader::LoadFromYamlString("storage:\n  sqlite:\n    path: \"" + path + "\"\n");
  ConfigLoader::ApplyDefaults(config);
  {
    auto storage = StorageFactory::Build(config.storage());
    storage->Set(c::kMetadata, practicedb::document::StringValue("kept"));
  }
  {
    auto storage = StorageFactory::Build(config.storage());
    assert(storage->Get(c::kMetadata)->string_value() == "kept");
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}
#endif

void TestInitializeMigratesAndSeeds() {
  auto config = ConfigLoader::LoadFromYamlString(R"(
storage:
  memory: {}
startup:
  seed: true
)");
  ConfigLoader::ApplyDefaults(config);

  auto app    = practicedb::factory::Build(config, std::make_shared<OfflineHttpClient>());
  auto report = practicedb::factory::Initialize(app, config);

  assert(report.migrations.size() == 3);
  assert(report.seeded);
  assert(report.seed.created > 0);
  assert(app.engine->Count(c::kPatients) == 6);
  assert(app.engine->GetMetadata().last_migration == std::optional<std::string>("1.2.0"));
  assert(!app.sync->Running());

  // A second start on the same store has nothing left to do.
  report = practicedb::factory::Initialize(app, config);
  assert(report.migrations.empty());
  assert(!report.seeded);
  assert(report.seed.skipped);
}

void TestMigrateCanBeDisabled() {
  auto config = ConfigLoader::LoadFromYamlString(R"(
startup:
  migrate: false
)");
  ConfigLoader::ApplyDefaults(config);

  auto       app    = practicedb::factory::Build(config, std::make_shared<OfflineHttpClient>());
  const auto report = practicedb::factory::Initialize(app, config);

  assert(report.migrations.empty());
  assert(!report.seeded);
  assert(app.engine->ListIndexes().empty());
}

} // namespace

int main() {
  TestEmptyStorageConfigSelectsMemory();
#if PRACTICEDB_STORAGE_SQLITE
  TestSqliteConfigPersistsAcrossBuilds();
#endif
  TestInitializeMigratesAndSeeds();
  TestMigrateCanBeDisabled();

  std::cout << "practicedb_unit_factory: pass\n";
  return 0;
}
