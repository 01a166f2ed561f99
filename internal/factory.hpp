#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/engine/database_engine.hpp"
#include "internal/seed/seeder.hpp"
#include "internal/storage/storage_adapter.hpp"
#include "internal/sync/http_client.hpp"
#include "internal/sync/sync_manager.hpp"
#include "internal/validation/validated_store.hpp"

namespace practicedb::factory {

/*
  Application

  Owns every long-lived component. Members are declared in dependency
  order so the sync thread stops before the engine goes away.
*/
struct Application {
  storage::StorageAdapterPtr                  storage;
  std::shared_ptr<db::DatabaseEngine>         engine;
  std::shared_ptr<validation::ValidatedStore> store;
  std::shared_ptr<sync::SyncManager>          sync;
};

struct StartupReport {
  std::vector<std::string> migrations;
  seed::SeedReport         seed;
  bool                     seeded = false;
};

/*
  Build

  Composition root: the only place that knows concrete storage and
  transport types. Nothing is migrated, seeded or started here.
*/
Application Build(const practicedb::runtime::config::RuntimeConfig& config, sync::HttpClientPtr http = nullptr);

/*
  Runs the startup sequence from config.startup(): migrations (unless
  migrate is explicitly false), then seeding when requested, then the
  periodic sync when enabled.
*/
StartupReport Initialize(Application& app, const practicedb::runtime::config::RuntimeConfig& config);

} // namespace practicedb::factory
