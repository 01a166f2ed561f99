#pragma once

#include <string>
#include <vector>

#include "migration.hpp"

namespace practicedb::migration {

// Numeric dot-separated comparison; missing parts count as 0. Returns <0, 0, >0.
int CompareVersions(const std::string& a, const std::string& b);

/*
  Applies schema migrations and records progress in database metadata.

  lastMigration is persisted after every successful step, so a failure
  leaves the database at the last version that applied cleanly.
*/
class MigrationRunner {
 public:
  explicit MigrationRunner(db::DatabaseEngine& engine, std::vector<Migration> migrations = BuiltinMigrations());

  // Versions applied by this call, oldest first. Throws util::MigrationError.
  std::vector<std::string> RunMigrations();

  // Reverts every applied version newer than target, newest first.
  std::vector<std::string> Rollback(const std::string& target);

  std::string CurrentVersion();

  // Migrations newer than CurrentVersion().
  std::vector<std::string> PendingVersions();

 private:
  db::DatabaseEngine&    engine_;
  std::vector<Migration> migrations_;
};

} // namespace practicedb::migration
