#include "constraints.hpp"

#include "internal/db/model/collections.hpp"

namespace practicedb::validation {

namespace c = practicedb::db::collections;

const char* ToString(OnDelete policy) {
  switch (policy) {
    case OnDelete::Restrict:
      return "restrict";
    case OnDelete::Cascade:
      return "cascade";
    case OnDelete::SetNull:
      return "set-null";
  }
  return "restrict";
}

const std::vector<ReferenceConstraint>& DefaultReferenceConstraints() {
  static const std::vector<ReferenceConstraint> kConstraints = {
      {c::kAppointments, "patientId", c::kPatients, OnDelete::Restrict, OnUpdate::Cascade},
      {c::kMedicalRecords, "patientId", c::kPatients, OnDelete::Cascade, OnUpdate::Cascade},
      {c::kLabResults, "patientId", c::kPatients, OnDelete::Cascade, OnUpdate::Cascade},
      {c::kClaims, "patientId", c::kPatients, OnDelete::Restrict, OnUpdate::Cascade},
      {c::kTelemedicineSessions, "appointmentId", c::kAppointments, OnDelete::SetNull, OnUpdate::Cascade},
  };
  return kConstraints;
}

const std::vector<UniqueConstraint>& DefaultUniqueConstraints() {
  static const std::vector<UniqueConstraint> kConstraints = {
      {c::kPatients, {"mrn"}},
      {c::kPatients, {"nationalId"}},
      {c::kClaims, {"claimNumber"}},
      {c::kUsers, {"email"}},
      {c::kUsers, {"githubId"}},
  };
  return kConstraints;
}

} // namespace practicedb::validation
