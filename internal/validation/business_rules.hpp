#pragma once

#include <string>
#include <vector>

#include "internal/db/engine/database_engine.hpp"

namespace practicedb::validation {

struct RuleResult {
  bool                            valid = true;
  std::string                     error;
  std::vector<document::Document> conflicts;
};

inline constexpr double kMaxClaimAmount      = 1000000.0;
inline constexpr double kClaimAmountTolerance = 0.01;

/*
  Two appointments of one doctor on one date conflict when
  [time, endTime) intervals intersect. Cancelled appointments and
  exclude_id are ignored; incomplete appointments never conflict.
*/
RuleResult ValidateAppointmentTime(db::DatabaseEngine& engine, const document::Document& appointment, const std::string& exclude_id = "");

// service_date must fall inside the patient's insuranceInfo validity range.
RuleResult ValidatePatientInsurance(db::DatabaseEngine& engine, const std::string& patient_id, const std::string& service_date);

// At least one service line, amount == sum(totalPrice) within tolerance, total under the ceiling.
RuleResult ValidateClaimAmount(const document::Document& claim);

// Pediatric codes need age < 18, geriatric codes age >= 65. Unknown codes pass.
RuleResult ValidatePatientAge(const document::Document& patient, const std::string& procedure_code);

} // namespace practicedb::validation
