#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "internal/document/value.hpp"

namespace practicedb::db::model {

inline constexpr const char* kInitialSchemaVersion = "1.0.0";

/*
  Singleton stored under db_metadata.

  version tracks the schema state migrations have brought the store to;
  last_migration is the newest migration applied (null before the first
  run, and after a rollback it equals version).
*/
struct DatabaseMetadata {
  std::string                     version = kInitialSchemaVersion;
  std::optional<std::string>      last_migration;
  std::string                     created_at;
  std::string                     updated_at;
  std::map<std::string, uint64_t> statistics;
};

document::Document ToDocument(const DatabaseMetadata& metadata);
DatabaseMetadata   MetadataFromDocument(const document::Document& doc);

} // namespace practicedb::db::model
