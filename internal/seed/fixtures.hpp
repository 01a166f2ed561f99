#pragma once

#include <vector>

#include "internal/document/value.hpp"
#include "internal/util/time.hpp"

namespace practicedb::seed {

// Sample practice data. Relative dates are computed from today.
std::vector<document::Document> UserFixtures();
std::vector<document::Document> PatientFixtures();
std::vector<document::Document> AppointmentFixtures(util::TimePoint today);
std::vector<document::Document> ClaimFixtures();
std::vector<document::Document> MedicalRecordFixtures(util::TimePoint today);
std::vector<document::Document> LabResultFixtures(util::TimePoint today);
std::vector<document::Document> NotificationFixtures(util::TimePoint now);

} // namespace practicedb::seed
