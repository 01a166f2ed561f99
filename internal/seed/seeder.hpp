#pragma once

#include <cstddef>

namespace practicedb::db {
class DatabaseEngine;
}

namespace practicedb::seed {

struct SeedReport {
  bool        skipped = false;
  std::size_t created = 0;
};

/*
  Loads the sample practice data through the engine.

  Collections are written in dependency order so every reference
  points at a document that already exists.
*/
class Seeder {
 public:
  explicit Seeder(db::DatabaseEngine& engine);

  // No-op while patients exist, unless force. force empties the domain collections first.
  // Fixture documents whose ids already exist are skipped.
  SeedReport Seed(bool force = false);

 private:
  void ClearDomainCollections();

  db::DatabaseEngine& engine_;
};

} // namespace practicedb::seed
