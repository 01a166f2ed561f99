#include "internal/db/model/collections.hpp"
#include "schema_registry.hpp"

namespace practicedb::schema {

namespace {

namespace c = practicedb::db::collections;

// Engine-owned fields: accepted when present, never required on input.
std::vector<std::pair<std::string, FieldSpec>> WithEngineFields(std::vector<std::pair<std::string, FieldSpec>> fields) {
  fields.emplace_back("id", String().Optional());
  fields.emplace_back("createdAt", String().Optional());
  fields.emplace_back("updatedAt", String().Optional());
  return fields;
}

FieldSpec PatientSchema() {
  return Object(WithEngineFields({
      {"mrn", String()},
      {"name", String().MinLength(2)},
      {"nameAr", String().Optional()},
      {"age", Number().Min(0).Max(150)},
      {"dateOfBirth", String()},
      {"gender", Enum({"male", "female"})},
      {"nationalId", String().Optional()},
      {"phone", String()},
      {"email", String().Email().Optional()},
      {"address", String()},
      {"emergencyContact", Object({
                               {"name", String()},
                               {"phone", String()},
                               {"relationship", String()},
                           })},
      {"bloodType", Enum({"A+", "A-", "B+", "B-", "AB+", "AB-", "O+", "O-"})},
      {"allergies", ArrayOf(String())},
      {"conditions", ArrayOf(String())},
      {"medications", ArrayOf(Object({
                          {"name", String()},
                          {"dosage", String()},
                          {"frequency", String()},
                          {"startDate", String()},
                          {"endDate", String().Optional()},
                          {"prescribedBy", String()},
                      }))},
      {"insuranceInfo", Object({
                            {"provider", String()},
                            {"policyNumber", String()},
                            {"groupNumber", String().Optional()},
                            {"validFrom", String()},
                            {"validTo", String()},
                            {"coverageType", Enum({"basic", "comprehensive", "premium"})},
                            {"nphiesId", String().Optional()},
                        })
                            .Optional()},
      {"lastVisit", String()},
      {"status", Enum({"stable", "critical", "improving", "monitoring", "discharged"})},
  }));
}

FieldSpec AppointmentSchema() {
  return Object(WithEngineFields({
      {"patientId", String()},
      {"patientName", String()},
      {"doctorId", String()},
      {"doctorName", String()},
      {"date", String()},
      {"time", String()},
      {"endTime", String()},
      {"type", Enum({"consultation", "follow-up", "telemedicine", "emergency", "procedure", "lab-visit", "imaging"})},
      {"status", Enum({"scheduled", "confirmed", "checked-in", "in-progress", "completed", "cancelled", "no-show", "rescheduled"})},
      {"duration", Number()},
      {"notes", String().Optional()},
      {"chiefComplaint", String().Optional()},
      {"location", String().Optional()},
      {"procedureCode", String().Optional()},
      {"isRecurring", Boolean().Optional()},
      {"recurringPattern", Object({
                               {"frequency", Enum({"daily", "weekly", "biweekly", "monthly"})},
                               {"interval", Number()},
                               {"endDate", String().Optional()},
                               {"occurrences", Number().Optional()},
                           })
                               .Optional()},
      {"reminders", ArrayOf(Object({
                        {"type", Enum({"sms", "email", "push"})},
                        {"scheduledFor", String()},
                        {"sent", Boolean()},
                        {"sentAt", String().Optional()},
                    }))},
      {"externalId", String().Optional()},
      {"externalSystem", String().Optional()},
      {"syncStatus", Enum({"pending", "synced", "error"}).Optional()},
  }));
}

FieldSpec ClaimSchema() {
  return Object(WithEngineFields({
      {"claimNumber", String()},
      {"patientId", String()},
      {"patientName", String()},
      {"patientNationalId", String().Optional()},
      {"insuranceId", String()},
      {"providerId", String()},
      {"serviceDate", String()},
      {"submittedDate", String()},
      {"amount", Number()},
      {"currency", Literal("SAR")},
      {"status", Enum({"draft", "pending", "submitted", "processing", "approved", "partially-approved", "rejected", "cancelled", "appealed"})},
      {"type", Enum({"institutional", "professional", "oral", "vision", "pharmacy"})},
      {"priority", Enum({"normal", "urgent", "emergency"})},
      {"services", ArrayOf(Object({
                       {"sequence", Number()},
                       {"serviceCode", String()},
                       {"serviceName", String()},
                       {"quantity", Number()},
                       {"unitPrice", Number()},
                       {"totalPrice", Number()},
                       {"serviceDate", String()},
                       {"diagnosisReference", ArrayOf(Number()).Optional()},
                   }))},
      {"diagnosis", ArrayOf(Object({
                        {"sequence", Number()},
                        {"code", String()},
                        {"system", Enum({"ICD-10", "ICD-11"})},
                        {"description", String()},
                        {"type", Enum({"principal", "secondary", "admitting"})},
                    }))},
      {"responseCode", String().Optional()},
      {"responseMessage", String().Optional()},
      {"approvedAmount", Number().Optional()},
      {"rejectionReason", String().Optional()},
      {"createdBy", String()},
      {"processedAt", String().Optional()},
  }));
}

FieldSpec MedicalRecordSchema() {
  return Object(WithEngineFields({
      {"patientId", String()},
      {"date", String()},
      {"type", Enum({"consultation", "procedure", "lab", "imaging", "prescription"})},
      {"diagnosis", String()},
      {"treatment", String()},
      {"notes", String()},
      {"vitals", Object({
                     {"bloodPressure", String()},
                     {"heartRate", Number()},
                     {"temperature", Number()},
                     {"respiratoryRate", Number().Optional()},
                     {"oxygenSaturation", Number().Optional()},
                     {"weight", Number()},
                     {"height", Number()},
                     {"bmi", Number()},
                     {"recordedAt", String()},
                 })
                     .Optional()},
      {"doctorId", String()},
      {"doctorName", String()},
      {"attachments", ArrayOf(Object({
                          {"id", String()},
                          {"name", String()},
                          {"type", String()},
                          {"size", Number()},
                          {"url", String()},
                          {"uploadedAt", String()},
                          {"uploadedBy", String()},
                      }))
                          .Optional()},
  }));
}

FieldSpec LabResultSchema() {
  return Object(WithEngineFields({
      {"patientId", String()},
      {"testName", String()},
      {"testCode", String().Optional()},
      {"result", String()},
      {"unit", String().Optional()},
      {"normalRange", String()},
      {"status", Enum({"normal", "abnormal", "critical"})},
      {"date", String()},
      {"performedBy", String().Optional()},
      {"notes", String().Optional()},
  }));
}

FieldSpec NotificationSchema() {
  return Object(WithEngineFields({
      {"userId", String()},
      {"type", Enum({"appointment-reminder", "appointment-cancelled", "lab-results", "claim-status", "consultation-request", "system-alert",
                     "urgent-patient"})},
      {"title", String()},
      {"message", String()},
      {"data", Object().Optional()},
      {"isRead", Boolean()},
      {"priority", Enum({"low", "normal", "high", "urgent"})},
      {"readAt", String().Optional()},
      {"expiresAt", String().Optional()},
  }));
}

FieldSpec UserSchema() {
  return Object(WithEngineFields({
      {"githubId", String()},
      {"email", String().Email()},
      {"name", String()},
      {"avatar", String().Optional()},
      {"role", Enum({"doctor", "nurse", "admin", "receptionist"})},
      {"specialization", String().Optional()},
      {"licenseNumber", String().Optional()},
      {"department", String().Optional()},
      {"isActive", Boolean()},
      {"lastLogin", String().Optional()},
      {"preferences", Object({
                          {"theme", Enum({"light", "dark", "system"})},
                          {"language", Enum({"en", "ar"})},
                          {"notifications", Object({
                                                {"email", Boolean()},
                                                {"sms", Boolean()},
                                                {"push", Boolean()},
                                            })},
                          {"defaultView", Enum({"dashboard", "appointments", "patients"})},
                      })},
  }));
}

FieldSpec MessageSchema() {
  return Object(WithEngineFields({
      {"conversationId", String()},
      {"senderId", String()},
      {"senderName", String()},
      {"content", String()},
      {"type", Enum({"text", "file", "consultation-request", "referral"})},
      {"attachments", ArrayOf(Object({
                          {"id", String()},
                          {"name", String()},
                          {"type", String()},
                          {"url", String()},
                      }))
                          .Optional()},
      {"isRead", Boolean()},
  }));
}

FieldSpec ConversationSchema() {
  return Object(WithEngineFields({
      {"participants", ArrayOf(Object({
                           {"id", String()},
                           {"name", String()},
                           {"avatar", String().Optional()},
                           {"role", String()},
                       }))},
      {"lastMessage", String().Optional()},
      {"lastMessageAt", String().Optional()},
      {"unreadCount", Number()},
      {"type", Enum({"direct", "group", "consultation"})},
  }));
}

FieldSpec TelemedicineSessionSchema() {
  return Object(WithEngineFields({
      // nulled when the referenced appointment is deleted
      {"appointmentId", String().Optional().Nullable()},
      {"patientId", String()},
      {"patientName", String()},
      {"doctorId", String()},
      {"doctorName", String()},
      {"scheduledTime", String()},
      {"startedAt", String().Optional()},
      {"endedAt", String().Optional()},
      {"duration", Number().Optional()},
      {"status", Enum({"scheduled", "waiting", "active", "completed", "missed", "cancelled", "technical-issue"})},
      {"type", Enum({"video", "audio", "chat"})},
      {"roomUrl", String().Optional()},
      {"recordingUrl", String().Optional()},
      {"isRecorded", Boolean()},
      {"notes", String().Optional()},
      {"prescription", String().Optional()},
      {"followUpRequired", Boolean().Optional()},
      {"technicalIssues", ArrayOf(String()).Optional()},
  }));
}

} // namespace

SchemaRegistry BuildDefaultSchemas() {
  SchemaRegistry registry;
  registry.Register(c::kPatients, PatientSchema());
  registry.Register(c::kAppointments, AppointmentSchema());
  registry.Register(c::kClaims, ClaimSchema());
  registry.Register(c::kMedicalRecords, MedicalRecordSchema());
  registry.Register(c::kLabResults, LabResultSchema());
  registry.Register(c::kNotifications, NotificationSchema());
  registry.Register(c::kUsers, UserSchema());
  registry.Register(c::kMessages, MessageSchema());
  registry.Register(c::kConversations, ConversationSchema());
  registry.Register(c::kTelemedicineSessions, TelemedicineSessionSchema());
  return registry;
}

} // namespace practicedb::schema
