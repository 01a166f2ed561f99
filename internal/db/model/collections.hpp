#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace practicedb::db {

/*
  Storage key registry.

  Domain collections are stored as one document array per key. Keys
  starting with "db_" but listed under Reserved hold engine state, and
  keys starting with kIndexPrefix hold derived index maps.
*/
namespace collections {

inline constexpr const char* kPatients             = "db_patients";
inline constexpr const char* kAppointments         = "db_appointments";
inline constexpr const char* kClaims               = "db_claims";
inline constexpr const char* kPreAuthorizations    = "db_pre_authorizations";
inline constexpr const char* kMedicalRecords       = "db_medical_records";
inline constexpr const char* kLabResults           = "db_lab_results";
inline constexpr const char* kNotifications        = "db_notifications";
inline constexpr const char* kUsers                = "db_users";
inline constexpr const char* kMessages             = "db_messages";
inline constexpr const char* kConversations        = "db_conversations";
inline constexpr const char* kTelemedicineSessions = "db_telemedicine_sessions";

// Reserved
inline constexpr const char* kMetadata      = "db_metadata";
inline constexpr const char* kSyncLog       = "db_sync_log";
inline constexpr const char* kIndexRegistry = "db_index_registry";

} // namespace collections

namespace indexes {

inline constexpr const char* kPrefix = "idx_";

inline constexpr const char* kPatientMrn        = "idx_patient_mrn";
inline constexpr const char* kPatientNationalId = "idx_patient_national_id";
inline constexpr const char* kAppointmentDate    = "idx_appointment_date";
inline constexpr const char* kAppointmentPatient = "idx_appointment_patient";
inline constexpr const char* kClaimNumber        = "idx_claim_number";
inline constexpr const char* kClaimStatus        = "idx_claim_status";

} // namespace indexes

// Every domain collection, in declaration order.
const std::vector<std::string>& DomainCollections();

// Collections holding patient or billing data; encrypted at rest when enabled.
const std::vector<std::string>& SensitiveCollections();

bool IsDomainCollection(std::string_view name);
bool IsReservedKey(std::string_view key);

// Storage key of an index; names without the idx_ prefix get it added.
std::string IndexKey(std::string_view index_name);

} // namespace practicedb::db
