#include "factory.hpp"

#include <memory>

#include "internal/migration/migration_runner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/schema/schema_registry.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/sync/curl_http_client.hpp"

namespace practicedb::factory {

Application Build(const practicedb::runtime::config::RuntimeConfig& config, sync::HttpClientPtr http) {
  Application app;

  // ------------------------------------------------------------------
  // Storage + engine
  // ------------------------------------------------------------------
  app.storage = storage::StorageFactory::Build(config.storage());
  app.engine  = std::make_shared<db::DatabaseEngine>(app.storage, config.engine());

  // ------------------------------------------------------------------
  // Validation layer
  // ------------------------------------------------------------------
  app.store = std::make_shared<validation::ValidatedStore>(app.engine, schema::BuildDefaultSchemas());

  // ------------------------------------------------------------------
  // Sync
  // ------------------------------------------------------------------
  if (!http) {
    http = std::make_shared<sync::CurlHttpClient>();
  }
  app.sync = std::make_shared<sync::SyncManager>(app.engine, config.sync(), std::move(http));

  return app;
}

StartupReport Initialize(Application& app, const practicedb::runtime::config::RuntimeConfig& config) {
  StartupReport report;
  const auto&   startup = config.startup();

  if (!startup.has_migrate() || startup.migrate()) {
    migration::MigrationRunner runner(*app.engine);
    report.migrations = runner.RunMigrations();
    if (!report.migrations.empty()) {
      PRACTICEDB_LOG_INFO("migrations applied", {observability::CountField("count", report.migrations.size()),
                                                 observability::StringField("version", report.migrations.back())});
    }
  }

  if (startup.seed()) {
    seed::Seeder seeder(*app.engine);
    report.seed   = seeder.Seed(startup.force_seed());
    report.seeded = !report.seed.skipped;
  }

  app.sync->Start();
  return report;
}

} // namespace practicedb::factory
