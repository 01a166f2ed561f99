#include "internal/schema/schema_registry.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/model/collections.hpp"
#include "internal/seed/fixtures.hpp"

namespace {

using namespace practicedb::schema;
namespace c = practicedb::db::collections;
namespace d = practicedb::document;

bool HasError(const ValidationResult& result, const std::string& path) {
  for (const auto& error : result.errors) {
    if (error.path == path) return true;
  }
  return false;
}

void TestFixturesAreValid() {
  const auto registry = BuildDefaultSchemas();
  const auto today    = practicedb::util::Now();

  for (const auto& doc : practicedb::seed::PatientFixtures()) assert(registry.Validate(c::kPatients, doc).valid);
  for (const auto& doc : practicedb::seed::UserFixtures()) assert(registry.Validate(c::kUsers, doc).valid);
  for (const auto& doc : practicedb::seed::AppointmentFixtures(today)) assert(registry.Validate(c::kAppointments, doc).valid);
  for (const auto& doc : practicedb::seed::ClaimFixtures()) assert(registry.Validate(c::kClaims, doc).valid);
  for (const auto& doc : practicedb::seed::MedicalRecordFixtures(today)) assert(registry.Validate(c::kMedicalRecords, doc).valid);
  for (const auto& doc : practicedb::seed::LabResultFixtures(today)) assert(registry.Validate(c::kLabResults, doc).valid);
  for (const auto& doc : practicedb::seed::NotificationFixtures(today)) assert(registry.Validate(c::kNotifications, doc).valid);
}

void TestMissingAndMistypedFields() {
  const auto registry = BuildDefaultSchemas();
  auto       patient  = practicedb::seed::PatientFixtures().front();

  patient.mutable_fields()->erase("mrn");
  d::SetNumber(patient, "age", 200);
  d::SetString(patient, "gender", "other");
  d::SetString(patient, "email", "not-an-email");
  d::SetString(patient, "name", "A");

  const auto result = registry.Validate(c::kPatients, patient);
  assert(!result.valid);
  assert(HasError(result, "mrn"));
  assert(HasError(result, "age"));
  assert(HasError(result, "gender"));
  assert(HasError(result, "email"));
  assert(HasError(result, "name"));
}

void TestNestedPathsAreDotted() {
  const auto registry = BuildDefaultSchemas();
  auto       claim    = practicedb::seed::ClaimFixtures().front();

  auto* services = (*claim.mutable_fields())["services"].mutable_list_value();
  d::SetString(*services->mutable_values(1)->mutable_struct_value(), "totalPrice", "1000");
  d::SetString(claim, "currency", "USD");

  const auto result = registry.Validate(c::kClaims, claim);
  assert(!result.valid);
  assert(HasError(result, "services.1.totalPrice"));
  assert(HasError(result, "currency"));
}

void TestPartialValidationSkipsAbsentFields() {
  const auto registry = BuildDefaultSchemas();

  assert(registry.ValidatePartial(c::kPatients, d::ParseDocument(R"({"status": "critical"})")).valid);
  assert(!registry.ValidatePartial(c::kPatients, d::ParseDocument(R"({"status": "unknown"})")).valid);

  // Nested objects that are present must still be complete.
  const auto nested = registry.ValidatePartial(c::kPatients, d::ParseDocument(R"({"emergencyContact": {"name": "X"}})"));
  assert(!nested.valid);
  assert(HasError(nested, "emergencyContact.phone"));
}

void TestNullRequiresNullable() {
  const auto registry = BuildDefaultSchemas();

  auto patch = d::ParseDocument(R"({"appointmentId": null})");
  assert(registry.ValidatePartial(c::kTelemedicineSessions, patch).valid);

  auto bad = d::ParseDocument(R"({"phone": null})");
  assert(!registry.ValidatePartial(c::kPatients, bad).valid);
}

void TestUnknownFieldsAndCollections() {
  const auto registry = BuildDefaultSchemas();

  auto patient = practicedb::seed::PatientFixtures().front();
  d::SetString(patient, "favouriteColour", "blue");
  assert(registry.Validate(c::kPatients, patient).valid);

  assert(!registry.Has("db_unknown"));
  assert(registry.Validate("db_unknown", d::ParseDocument(R"({"anything": 1})")).valid);
}

void TestRootMustBeObject() {
  SchemaRegistry registry;
  bool           threw = false;
  try {
    registry.Register("db_things", String());
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  registry.Register("db_things", Object({{"count", Number().Int().Min(1)}}));
  assert(registry.Collections().size() == 1);
  assert(!registry.Validate("db_things", d::ParseDocument(R"({"count": 1.5})")).valid);
  assert(!registry.Validate("db_things", d::ParseDocument(R"({"count": 0})")).valid);
  assert(registry.Validate("db_things", d::ParseDocument(R"({"count": 2})")).valid);
}

} // namespace

int main() {
  TestFixturesAreValid();
  TestMissingAndMistypedFields();
  TestNestedPathsAreDotted();
  TestPartialValidationSkipsAbsentFields();
  TestNullRequiresNullable();
  TestUnknownFieldsAndCollections();
  TestRootMustBeObject();

  std::cout << "practicedb_unit_schema_registry: pass\n";
  return 0;
}
