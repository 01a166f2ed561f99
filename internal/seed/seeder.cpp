#include "seeder.hpp"

#include <unordered_set>

#include "fixtures.hpp"
#include "internal/db/engine/database_engine.hpp"
#include "internal/db/model/collections.hpp"
#include "internal/observability/logging.hpp"

namespace practicedb::seed {

namespace c = practicedb::db::collections;

Seeder::Seeder(db::DatabaseEngine& engine) : engine_(engine) {
}

SeedReport Seeder::Seed(bool force) {
  SeedReport report;

  if (engine_.Count(c::kPatients) > 0 && !force) {
    PRACTICEDB_LOG_INFO("database already has data, skipping seed");
    report.skipped = true;
    return report;
  }

  if (force) {
    ClearDomainCollections();
  }

  const auto now = util::Now();
  // Fixture ids already present are left alone so a partially populated database can be topped up.
  const auto load = [&](const char* collection, const std::vector<document::Document>& fixtures) {
    std::unordered_set<std::string> existing;
    for (const auto& doc : engine_.GetAll(collection)) existing.insert(document::DocumentId(doc));

    std::vector<document::Document> docs;
    for (const auto& doc : fixtures) {
      if (!existing.count(document::DocumentId(doc))) docs.push_back(doc);
    }
    if (docs.empty()) return;

    engine_.CreateMany(collection, docs);
    report.created += docs.size();
    PRACTICEDB_LOG_INFO("seeded collection", {observability::CollectionField(collection),
                                              observability::CountField("documents", docs.size()),
                                              observability::CountField("kept", fixtures.size() - docs.size())});
  };

  load(c::kUsers, UserFixtures());
  load(c::kPatients, PatientFixtures());
  load(c::kAppointments, AppointmentFixtures(now));
  load(c::kClaims, ClaimFixtures());
  load(c::kMedicalRecords, MedicalRecordFixtures(now));
  load(c::kLabResults, LabResultFixtures(now));
  load(c::kNotifications, NotificationFixtures(now));

  engine_.UpdateStatistics();
  return report;
}

void Seeder::ClearDomainCollections() {
  for (const auto& collection : db::DomainCollections()) {
    engine_.DeleteMany(collection, db::Where{});
  }
}

} // namespace practicedb::seed
