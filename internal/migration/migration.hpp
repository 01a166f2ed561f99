#pragma once

#include <functional>
#include <string>
#include <vector>

namespace practicedb::db {
class DatabaseEngine;
}

namespace practicedb::migration {

struct Migration {
  std::string                              version;
  std::string                              name;
  std::function<void(db::DatabaseEngine&)> up;
  std::function<void(db::DatabaseEngine&)> down;
};

// Ordered by version, oldest first.
const std::vector<Migration>& BuiltinMigrations();

} // namespace practicedb::migration
