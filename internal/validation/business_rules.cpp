#include "business_rules.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <sstream>

#include "internal/db/model/collections.hpp"

namespace practicedb::validation {

namespace {

constexpr std::array<const char*, 3> kPediatricProcedures = {"PED-001", "PED-002", "PED-003"};
constexpr std::array<const char*, 2> kGeriatricProcedures = {"GER-001", "GER-002"};

template <std::size_t N>
bool Contains(const std::array<const char*, N>& codes, const std::string& code) {
  return std::any_of(codes.begin(), codes.end(), [&](const char* c) { return code == c; });
}

std::string Str(const document::Document& doc, const char* field) {
  return document::StringField(doc, field).value_or("");
}

RuleResult Fail(std::string error) {
  RuleResult result;
  result.valid = false;
  result.error = std::move(error);
  return result;
}

} // namespace

RuleResult ValidateAppointmentTime(db::DatabaseEngine& engine, const document::Document& appointment, const std::string& exclude_id) {
  const auto doctor_id = Str(appointment, "doctorId");
  const auto date      = Str(appointment, "date");
  const auto time      = Str(appointment, "time");
  const auto end_time  = Str(appointment, "endTime");
  if (doctor_id.empty() || date.empty() || time.empty() || end_time.empty()) return {};

  db::QueryOptions options;
  options.limit = std::numeric_limits<std::size_t>::max();
  options.where = db::Predicate([&](const document::Document& apt) {
    if (Str(apt, "doctorId") != doctor_id || Str(apt, "date") != date) return false;
    if (document::DocumentId(apt) == exclude_id && !exclude_id.empty()) return false;
    if (Str(apt, "status") == "cancelled") return false;
    return !(Str(apt, "endTime") <= time || Str(apt, "time") >= end_time);
  });

  auto       found = engine.Query(db::collections::kAppointments, options);
  RuleResult result;
  result.valid     = found.total == 0;
  result.conflicts = std::move(found.data);
  if (!result.valid) result.error = "Appointment time conflicts with existing appointments";
  return result;
}

RuleResult ValidatePatientInsurance(db::DatabaseEngine& engine, const std::string& patient_id, const std::string& service_date) {
  const auto patient = engine.Get(db::collections::kPatients, patient_id);
  if (!patient) return Fail("Patient not found");

  const auto* insurance = document::FindField(*patient, "insuranceInfo");
  if (!insurance || !insurance->has_struct_value()) return Fail("Patient has no insurance information");

  const auto valid_from = Str(insurance->struct_value(), "validFrom");
  const auto valid_to   = Str(insurance->struct_value(), "validTo");
  if (service_date < valid_from || service_date > valid_to) return Fail("Insurance is not valid for the service date");

  return {};
}

RuleResult ValidateClaimAmount(const document::Document& claim) {
  const auto* services = document::FindField(claim, "services");
  if (!services || !services->has_list_value() || services->list_value().values_size() == 0) {
    return Fail("Claim must have at least one service");
  }

  double total = 0;
  for (const auto& service : services->list_value().values()) {
    if (!service.has_struct_value()) continue;
    total += document::ToNumberOrZero(document::FindField(service.struct_value(), "totalPrice"));
  }

  if (const auto amount = document::NumberField(claim, "amount"); amount && std::fabs(*amount - total) > kClaimAmountTolerance) {
    return Fail("Claim amount does not match services total");
  }

  if (total > kMaxClaimAmount) {
    std::ostringstream out;
    out << "Claim amount exceeds maximum of " << static_cast<long long>(kMaxClaimAmount) << " SAR";
    return Fail(out.str());
  }

  return {};
}

RuleResult ValidatePatientAge(const document::Document& patient, const std::string& procedure_code) {
  if (procedure_code.empty()) return {};

  const double age = document::NumberField(patient, "age").value_or(0);
  if (Contains(kPediatricProcedures, procedure_code) && age >= 18) {
    return Fail("Procedure is for pediatric patients only");
  }
  if (Contains(kGeriatricProcedures, procedure_code) && age < 65) {
    return Fail("Procedure is for geriatric patients only");
  }
  return {};
}

} // namespace practicedb::validation
