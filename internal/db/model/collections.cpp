#include "collections.hpp"

#include <algorithm>

namespace practicedb::db {

const std::vector<std::string>& DomainCollections() {
  static const std::vector<std::string> kAll = {
      collections::kPatients,
      collections::kAppointments,
      collections::kClaims,
      collections::kPreAuthorizations,
      collections::kMedicalRecords,
      collections::kLabResults,
      collections::kNotifications,
      collections::kUsers,
      collections::kMessages,
      collections::kConversations,
      collections::kTelemedicineSessions,
  };
  return kAll;
}

const std::vector<std::string>& SensitiveCollections() {
  static const std::vector<std::string> kSensitive = {
      collections::kPatients,
      collections::kMedicalRecords,
      collections::kLabResults,
      collections::kClaims,
      collections::kPreAuthorizations,
      collections::kTelemedicineSessions,
  };
  return kSensitive;
}

bool IsDomainCollection(std::string_view name) {
  const auto& all = DomainCollections();
  return std::find(all.begin(), all.end(), name) != all.end();
}

bool IsReservedKey(std::string_view key) {
  return key == collections::kMetadata || key == collections::kSyncLog || key == collections::kIndexRegistry ||
         key.substr(0, 4) == indexes::kPrefix;
}

std::string IndexKey(std::string_view index_name) {
  if (index_name.substr(0, 4) == indexes::kPrefix) return std::string(index_name);
  return std::string(indexes::kPrefix) + std::string(index_name);
}

} // namespace practicedb::db
