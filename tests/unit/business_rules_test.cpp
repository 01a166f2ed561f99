#include "internal/validation/business_rules.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/model/collections.hpp"
#include "internal/storage/memory/memory_storage_adapter.hpp"

namespace {

using namespace practicedb::validation;
using practicedb::db::DatabaseEngine;
namespace c = practicedb::db::collections;
namespace d = practicedb::document;

std::unique_ptr<DatabaseEngine> MakeEngine() {
  return std::make_unique<DatabaseEngine>(std::make_shared<practicedb::storage::MemoryStorageAdapter>());
}

void TestOverlappingAppointmentsConflict() {
  auto engine = MakeEngine();
  engine->Create(c::kAppointments,
                 d::ParseDocument(R"({"id": "a1", "doctorId": "doc_1", "date": "2024-12-01", "time": "09:00", "endTime": "09:30", "status": "scheduled"})"));
  engine->Create(c::kAppointments,
                 d::ParseDocument(R"({"id": "a2", "doctorId": "doc_1", "date": "2024-12-01", "time": "10:00", "endTime": "10:30", "status": "cancelled"})"));

  auto overlapping = d::ParseDocument(R"({"doctorId": "doc_1", "date": "2024-12-01", "time": "09:15", "endTime": "09:45"})");
  auto result      = ValidateAppointmentTime(*engine, overlapping);
  assert(!result.valid);
  assert(result.error == "Appointment time conflicts with existing appointments");
  assert(result.conflicts.size() == 1);
  assert(d::DocumentId(result.conflicts[0]) == "a1");

  // Back-to-back slots touch but do not overlap.
  auto adjacent = d::ParseDocument(R"({"doctorId": "doc_1", "date": "2024-12-01", "time": "09:30", "endTime": "10:00"})");
  assert(ValidateAppointmentTime(*engine, adjacent).valid);

  // Cancelled appointments free their slot.
  auto over_cancelled = d::ParseDocument(R"({"doctorId": "doc_1", "date": "2024-12-01", "time": "10:00", "endTime": "10:30"})");
  assert(ValidateAppointmentTime(*engine, over_cancelled).valid);

  // Another doctor or another day never conflicts.
  auto other_doctor = d::ParseDocument(R"({"doctorId": "doc_2", "date": "2024-12-01", "time": "09:00", "endTime": "09:30"})");
  assert(ValidateAppointmentTime(*engine, other_doctor).valid);

  // Rescheduling an appointment ignores its own slot.
  auto moved = engine->Get(c::kAppointments, "a1").value();
  d::SetString(moved, "time", "09:10");
  assert(ValidateAppointmentTime(*engine, moved, "a1").valid);

  // Incomplete appointments are not checked.
  assert(ValidateAppointmentTime(*engine, d::ParseDocument(R"({"doctorId": "doc_1", "date": "2024-12-01"})")).valid);
}

void TestInsuranceValidity() {
  auto engine = MakeEngine();
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p1", "insuranceInfo": {"validFrom": "2024-01-01", "validTo": "2024-12-31"}})"));
  engine->Create(c::kPatients, d::ParseDocument(R"({"id": "p2"})"));

  assert(ValidatePatientInsurance(*engine, "p1", "2024-06-15").valid);
  assert(ValidatePatientInsurance(*engine, "p1", "2024-12-31").valid);

  auto expired = ValidatePatientInsurance(*engine, "p1", "2025-01-01");
  assert(!expired.valid);
  assert(expired.error == "Insurance is not valid for the service date");

  assert(ValidatePatientInsurance(*engine, "p2", "2024-06-15").error == "Patient has no insurance information");
  assert(ValidatePatientInsurance(*engine, "missing", "2024-06-15").error == "Patient not found");
}

void TestClaimAmount() {
  auto ok = d::ParseDocument(R"({"amount": 1500, "services": [{"totalPrice": 500}, {"totalPrice": 1000}]})");
  assert(ValidateClaimAmount(ok).valid);

  auto within_tolerance = d::ParseDocument(R"({"amount": 100.005, "services": [{"totalPrice": 100}]})");
  assert(ValidateClaimAmount(within_tolerance).valid);

  auto mismatch = d::ParseDocument(R"({"amount": 1400, "services": [{"totalPrice": 500}, {"totalPrice": 1000}]})");
  assert(ValidateClaimAmount(mismatch).error == "Claim amount does not match services total");

  auto empty = d::ParseDocument(R"({"amount": 0, "services": []})");
  assert(ValidateClaimAmount(empty).error == "Claim must have at least one service");

  auto too_large = d::ParseDocument(R"({"amount": 1000001, "services": [{"totalPrice": 1000001}]})");
  assert(ValidateClaimAmount(too_large).error == "Claim amount exceeds maximum of 1000000 SAR");
}

void TestPatientAge() {
  const auto child  = d::ParseDocument(R"({"age": 10})");
  const auto adult  = d::ParseDocument(R"({"age": 40})");
  const auto senior = d::ParseDocument(R"({"age": 70})");

  assert(ValidatePatientAge(child, "PED-001").valid);
  assert(ValidatePatientAge(adult, "PED-002").error == "Procedure is for pediatric patients only");
  assert(ValidatePatientAge(senior, "GER-001").valid);
  assert(ValidatePatientAge(adult, "GER-002").error == "Procedure is for geriatric patients only");
  assert(ValidatePatientAge(adult, "CONS-001").valid);
  assert(ValidatePatientAge(adult, "").valid);
}

} // namespace

int main() {
  TestOverlappingAppointmentsConflict();
  TestInsuranceValidity();
  TestClaimAmount();
  TestPatientAge();

  std::cout << "practicedb_unit_business_rules: pass\n";
  return 0;
}
