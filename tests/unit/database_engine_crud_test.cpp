#include "internal/db/engine/database_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/model/collections.hpp"
#include "internal/storage/memory/memory_storage_adapter.hpp"
#include "internal/util/errors.hpp"

namespace {

using practicedb::db::ChangeEvent;
using practicedb::db::ChangeKind;
using practicedb::db::DatabaseEngine;
namespace c = practicedb::db::collections;
namespace d = practicedb::document;

std::unique_ptr<DatabaseEngine> MakeEngine() {
  return std::make_unique<DatabaseEngine>(std::make_shared<practicedb::storage::MemoryStorageAdapter>());
}

void TestCreateStampsIdAndTimestamps() {
  auto engine  = MakeEngine();
  auto created = engine->Create(c::kPatients, d::ParseDocument(R"({"name": "Ahmed", "mrn": "MRN-1"})"));

  assert(!d::DocumentId(created).empty());
  const auto created_at = d::StringField(created, d::kCreatedAtField);
  assert(created_at.has_value());
  assert(d::StringField(created, d::kUpdatedAtField) == created_at);

  const auto fetched = engine->Get(c::kPatients, d::DocumentId(created));
  assert(fetched.has_value());
  assert(d::StringField(*fetched, "name") == std::optional<std::string>("Ahmed"));
}

void TestCreateWithTakenIdThrows() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Ahmed"})"));

  bool threw = false;
  try {
    engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Other"})"));
  } catch (const practicedb::util::AlreadyExists& e) {
    threw = std::string(e.what()) == "Document with ID p1 already exists in db_patients";
  }
  assert(threw);
  assert(engine->GetAll(c::kPatients).size() == 1);
}

void TestUpdateMergesAndProtectsEngineFields() {
  auto engine  = MakeEngine();
  auto created = engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Ahmed", "status": "stable"})"));

  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  auto patch   = d::ParseDocument(R"({"id": "hijack", "createdAt": "1999-01-01T00:00:00.000Z", "status": "critical"})");
  auto updated = engine->Update(c::kPatients, "p1", patch);

  assert(updated.has_value());
  assert(d::DocumentId(*updated) == "p1");
  assert(d::StringField(*updated, "status") == std::optional<std::string>("critical"));
  assert(d::StringField(*updated, "name") == std::optional<std::string>("Ahmed"));
  assert(d::StringField(*updated, d::kCreatedAtField) == d::StringField(created, d::kCreatedAtField));
  assert(*d::StringField(*updated, d::kUpdatedAtField) >= *d::StringField(created, d::kUpdatedAtField));

  assert(!engine->Update(c::kPatients, "missing", patch).has_value());
}

void TestUpsertCreatesThenUpdates() {
  auto engine = MakeEngine();
  engine->Upsert(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Ahmed"})"));
  engine->Upsert(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Ahmed R."})"));

  const auto all = engine->GetAll(c::kPatients);
  assert(all.size() == 1);
  assert(d::StringField(all[0], "name") == std::optional<std::string>("Ahmed R."));
}

void TestDeleteAndDeleteMany() {
  auto engine = MakeEngine();
  engine->Create(c::kAppointments, d::ParseDocument(R"({"id": "a1", "patientId": "p1"})"));
  engine->Create(c::kAppointments, d::ParseDocument(R"({"id": "a2", "patientId": "p1"})"));
  engine->Create(c::kAppointments, d::ParseDocument(R"({"id": "a3", "patientId": "p2"})"));

  assert(engine->Delete(c::kAppointments, "a3"));
  assert(!engine->Delete(c::kAppointments, "a3"));
  assert(!engine->Get(c::kAppointments, "a3").has_value());

  const auto removed = engine->DeleteMany(c::kAppointments, d::ParseDocument(R"({"patientId": "p1"})"));
  assert(removed == 2);
  assert(engine->Count(c::kAppointments) == 0);
}

void TestCreateManyIsAllOrNothing() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p2"})"));

  bool threw = false;
  try {
    engine->CreateMany(c::kPatients, {d::ParseDocument(R"({"id": "p1"})"), d::ParseDocument(R"({"id": "p2"})")});
  } catch (const practicedb::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
  assert(engine->Count(c::kPatients) == 1);

  const auto created = engine->CreateMany(c::kPatients, {d::ParseDocument(R"({"id": "p3"})"), d::ParseDocument(R"({"name": "anon"})")});
  assert(created.size() == 2);
  assert(engine->Count(c::kPatients) == 3);
}

void TestUpdateManySkipsUnknownIds() {
  auto engine = MakeEngine();
  engine->CreateMany(c::kClaims, {d::ParseDocument(R"({"id": "c1", "status": "draft"})"), d::ParseDocument(R"({"id": "c2", "status": "draft"})")});

  const auto updated = engine->UpdateMany(c::kClaims, {{"c1", d::ParseDocument(R"({"status": "submitted"})")},
                                                       {"missing", d::ParseDocument(R"({"status": "submitted"})")}});
  assert(updated == 1);
  assert(d::StringField(*engine->Get(c::kClaims, "c1"), "status") == std::optional<std::string>("submitted"));
  assert(d::StringField(*engine->Get(c::kClaims, "c2"), "status") == std::optional<std::string>("draft"));
}

void TestGetServesFreshDataAfterUpdate() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "name": "Ahmed"})"));
  (void)engine->Get(c::kPatients, "p1");

  engine->Update(c::kPatients, "p1", d::ParseDocument(R"({"name": "Ahmed R."})"));
  assert(d::StringField(*engine->Get(c::kPatients, "p1"), "name") == std::optional<std::string>("Ahmed R."));
}

void TestSubscribersReceiveOneEventPerCall() {
  auto                     engine = MakeEngine();
  std::vector<ChangeEvent> events;

  auto sub = engine->Subscribe(c::kPatients, [&](const ChangeEvent& event) { events.push_back(event); });

  engine->CreateMany(c::kPatients, {d::ParseDocument(R"({"id": "p1"})"), d::ParseDocument(R"({"id": "p2"})")});
  engine->Update(c::kPatients, "p1", d::ParseDocument(R"({"name": "x"})"));
  engine->Delete(c::kPatients, "p2");
  engine->Create(c::kClaims, d::ParseDocument(R"({"id": "c1"})"));

  assert(events.size() == 3);
  assert(events[0].kind == ChangeKind::Created);
  assert(events[0].document_ids.size() == 2);
  assert(events[0].snapshot.size() == 2);
  assert(events[1].kind == ChangeKind::Updated);
  assert(events[2].kind == ChangeKind::Deleted);
  assert(events[2].snapshot.size() == 1);
}

void TestSubscriberMayReadFromEngine() {
  auto        engine = MakeEngine();
  std::size_t seen   = 0;

  auto sub = engine->Subscribe(c::kPatients, [&](const ChangeEvent&) { seen = engine->Count(c::kPatients); });
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1"})"));
  assert(seen == 1);
}

} // namespace

int main() {
  TestCreateStampsIdAndTimestamps();
  TestCreateWithTakenIdThrows();
  TestUpdateMergesAndProtectsEngineFields();
  TestUpsertCreatesThenUpdates();
  TestDeleteAndDeleteMany();
  TestCreateManyIsAllOrNothing();
  TestUpdateManySkipsUnknownIds();
  TestGetServesFreshDataAfterUpdate();
  TestSubscribersReceiveOneEventPerCall();
  TestSubscriberMayReadFromEngine();

  std::cout << "practicedb_unit_engine_crud: pass\n";
  return 0;
}
