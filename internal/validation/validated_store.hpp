#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "constraints.hpp"
#include "integrity_report.hpp"
#include "internal/db/engine/database_engine.hpp"
#include "internal/schema/schema_registry.hpp"

namespace practicedb::validation {

struct DeleteCheck {
  bool                     can_delete = true;
  std::vector<std::string> blocked_by;
};

struct UniqueCheck {
  bool                     valid = true;
  std::vector<std::string> violations;
};

/*
  Validated entry points over a DatabaseEngine.

  Writes run, in order:
    schema → unique constraints → references and business rules → engine

  The first failing check throws util::ValidationError or
  util::IntegrityError and nothing is written.
*/
class ValidatedStore {
 public:
  ValidatedStore(std::shared_ptr<db::DatabaseEngine> engine, schema::SchemaRegistry schemas,
                 std::vector<ReferenceConstraint> references = DefaultReferenceConstraints(),
                 std::vector<UniqueConstraint>    uniques    = DefaultUniqueConstraints());

  document::Document                CreateValidated(const std::string& collection, const document::Document& data);
  std::optional<document::Document> UpdateValidated(const std::string& collection, const std::string& id, const document::Document& patch);

  // Blocked by restrict references; otherwise cascades, nulls, then deletes.
  bool DeleteValidated(const std::string& collection, const std::string& id);

  // ------------------------------------------------------------------
  // Building blocks
  // ------------------------------------------------------------------
  bool        CheckReferenceExists(const std::string& collection, const std::string& id);
  DeleteCheck CheckDeleteConstraints(const std::string& collection, const std::string& id);
  void        HandleDeleteCascade(const std::string& collection, const std::string& id);
  UniqueCheck CheckUniqueConstraints(const std::string& collection, const document::Document& data, const std::string& exclude_id = "");

  // ------------------------------------------------------------------
  // Read-only audit
  // ------------------------------------------------------------------
  IntegrityReport              RunIntegrityCheck(const std::string& collection);
  std::vector<IntegrityReport> RunFullIntegrityCheck();

  const schema::SchemaRegistry& Schemas() const {
    return schemas_;
  }

  db::DatabaseEngine& Engine() {
    return *engine_;
  }

 private:
  // Only constraints with a field set in patch are checked; all of them when patch is null.
  UniqueCheck UniqueViolations(const std::string& collection, const document::Document& data, const std::string& exclude_id,
                               const document::Document* patch);
  void        CheckReferences(const std::string& collection, const document::Document& doc, const document::Document* patch);
  void CheckBusinessRules(const std::string& collection, const document::Document& doc, const document::Document* patch,
                          const std::string& exclude_id);

  std::shared_ptr<db::DatabaseEngine> engine_;
  schema::SchemaRegistry              schemas_;
  std::vector<ReferenceConstraint>    references_;
  std::vector<UniqueConstraint>       uniques_;
};

} // namespace practicedb::validation
