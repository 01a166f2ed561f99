#include "internal/seed/seeder.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/engine/database_engine.hpp"
#include "internal/db/model/collections.hpp"
#include "internal/storage/memory/memory_storage_adapter.hpp"
#include "internal/validation/validated_store.hpp"

namespace {

using practicedb::db::DatabaseEngine;
using practicedb::seed::Seeder;
namespace c = practicedb::db::collections;

std::shared_ptr<DatabaseEngine> MakeEngine() {
  return std::make_shared<DatabaseEngine>(std::make_shared<practicedb::storage::MemoryStorageAdapter>());
}

void AssertSampleCounts(DatabaseEngine& engine) {
  assert(engine.Count(c::kUsers) == 3);
  assert(engine.Count(c::kPatients) == 6);
  assert(engine.Count(c::kAppointments) == 5);
  assert(engine.Count(c::kClaims) == 4);
  assert(engine.Count(c::kMedicalRecords) == 3);
  assert(engine.Count(c::kLabResults) == 3);
  assert(engine.Count(c::kNotifications) == 4);
}

void TestSeedLoadsSampleData() {
  auto   engine = MakeEngine();
  Seeder seeder(*engine);

  const auto report = seeder.Seed();
  assert(!report.skipped);
  assert(report.created == 28);
  AssertSampleCounts(*engine);

  const auto metadata = engine->GetMetadata();
  assert(metadata.statistics.at(c::kPatients) == 6);
  assert(metadata.statistics.at(c::kClaims) == 4);
}

void TestSeedSkipsPopulatedDatabase() {
  auto   engine = MakeEngine();
  Seeder seeder(*engine);
  seeder.Seed();

  const auto again = seeder.Seed();
  assert(again.skipped);
  assert(again.created == 0);
  AssertSampleCounts(*engine);
}

void TestForceReplacesData() {
  auto   engine = MakeEngine();
  Seeder seeder(*engine);
  seeder.Seed();
  engine->Create(c::kPatients, practicedb::document::ParseDocument(R"({"id": "extra"})"));

  const auto report = seeder.Seed(true);
  assert(!report.skipped);
  assert(!engine->Get(c::kPatients, "extra").has_value());
  AssertSampleCounts(*engine);
}

void TestSeedTopsUpPartiallyClearedDatabase() {
  auto   engine = MakeEngine();
  Seeder seeder(*engine);
  seeder.Seed();

  engine->DeleteMany(c::kAppointments, practicedb::db::Where{});
  engine->DeleteMany(c::kClaims, practicedb::db::Where{});
  engine->DeleteMany(c::kPatients, practicedb::db::Where{});
  assert(engine->Count(c::kPatients) == 0);

  const auto report = seeder.Seed(false);
  assert(!report.skipped);
  assert(report.created == 15);
  AssertSampleCounts(*engine);
}

void TestSeededDataPassesIntegrityCheck() {
  auto   engine = MakeEngine();
  Seeder seeder(*engine);
  seeder.Seed();

  practicedb::validation::ValidatedStore store(engine, practicedb::schema::BuildDefaultSchemas());
  for (const auto& report : store.RunFullIntegrityCheck()) {
    if (!report.issues.empty()) {
      std::cerr << report.collection << ": " << report.issues.front().message << "\n";
    }
    assert(report.issues.empty());
  }
}

} // namespace

int main() {
  TestSeedLoadsSampleData();
  TestSeedSkipsPopulatedDatabase();
  TestForceReplacesData();
  TestSeedTopsUpPartiallyClearedDatabase();
  TestSeededDataPassesIntegrityCheck();

  std::cout << "practicedb_unit_seeder: pass\n";
  return 0;
}
