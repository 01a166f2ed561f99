#include "migration.hpp"

#include "internal/db/engine/database_engine.hpp"
#include "internal/db/model/collections.hpp"

namespace practicedb::migration {

namespace c   = practicedb::db::collections;
namespace idx = practicedb::db::indexes;

const std::vector<Migration>& BuiltinMigrations() {
  static const std::vector<Migration> kMigrations = {
      {"1.0.0", "initial_schema",
       [](db::DatabaseEngine& engine) {
         engine.CreateIndex(c::kPatients, "mrn", idx::kPatientMrn);
         engine.CreateIndex(c::kAppointments, "date", idx::kAppointmentDate);
         engine.CreateIndex(c::kClaims, "status", idx::kClaimStatus);
       },
       [](db::DatabaseEngine& engine) {
         engine.DropIndex(idx::kPatientMrn);
         engine.DropIndex(idx::kAppointmentDate);
         engine.DropIndex(idx::kClaimStatus);
       }},

      {"1.1.0", "add_patient_national_id_index",
       [](db::DatabaseEngine& engine) { engine.CreateIndex(c::kPatients, "nationalId", idx::kPatientNationalId); },
       [](db::DatabaseEngine& engine) { engine.DropIndex(idx::kPatientNationalId); }},

      {"1.2.0", "add_appointment_patient_and_claim_number_indexes",
       [](db::DatabaseEngine& engine) {
         engine.CreateIndex(c::kAppointments, "patientId", idx::kAppointmentPatient);
         engine.CreateIndex(c::kClaims, "claimNumber", idx::kClaimNumber);
       },
       [](db::DatabaseEngine& engine) {
         engine.DropIndex(idx::kAppointmentPatient);
         engine.DropIndex(idx::kClaimNumber);
       }},
  };
  return kMigrations;
}

} // namespace practicedb::migration
