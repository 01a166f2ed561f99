#include "validated_store.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "business_rules.hpp"
#include "internal/db/model/collections.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace practicedb::validation {

namespace c = practicedb::db::collections;

namespace {

std::string Join(const std::vector<std::string>& parts, const char* separator) {
  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) out += separator;
    out += part;
  }
  return out;
}

std::string FormatErrors(const std::vector<util::FieldError>& errors) {
  std::vector<std::string> lines;
  lines.reserve(errors.size());
  for (const auto& error : errors) lines.push_back(error.path + ": " + error.message);
  return Join(lines, "; ");
}

std::string Str(const document::Document& doc, const std::string& field) {
  return document::StringField(doc, field).value_or("");
}

// True when the patch is absent (create) or sets one of fields.
bool Touches(const document::Document* patch, std::initializer_list<const char*> fields) {
  if (!patch) return true;
  return std::any_of(fields.begin(), fields.end(), [&](const char* f) { return document::FindField(*patch, f) != nullptr; });
}

db::Predicate FieldEquals(std::string field, std::string id) {
  return [field = std::move(field), id = std::move(id)](const document::Document& doc) {
    const auto* v = document::FindField(doc, field);
    return v && v->has_string_value() && v->string_value() == id;
  };
}

std::string ReferenceKey(const document::Value* v) {
  return v->has_string_value() ? v->string_value() : document::ValueKey(v);
}

document::Document Overlay(const document::Document& existing, const document::Document& patch) {
  document::Document merged = existing;
  for (const auto& [key, value] : patch.fields()) {
    if (key == document::kIdField || key == document::kCreatedAtField || key == document::kUpdatedAtField) continue;
    (*merged.mutable_fields())[key] = value;
  }
  return merged;
}

} // namespace

ValidatedStore::ValidatedStore(std::shared_ptr<db::DatabaseEngine> engine, schema::SchemaRegistry schemas, std::vector<ReferenceConstraint> references,
                               std::vector<UniqueConstraint> uniques)
    : engine_(std::move(engine)), schemas_(std::move(schemas)), references_(std::move(references)), uniques_(std::move(uniques)) {
  if (!engine_) {
    throw std::invalid_argument("ValidatedStore requires an engine");
  }
}

// ------------------------------------------------------------
// Validated writes
// ------------------------------------------------------------

document::Document ValidatedStore::CreateValidated(const std::string& collection, const document::Document& data) {
  const auto result = schemas_.Validate(collection, data);
  if (!result.valid) {
    throw util::ValidationError(FormatErrors(result.errors), result.errors.front().path, result.errors);
  }

  const auto unique = CheckUniqueConstraints(collection, data);
  if (!unique.valid) {
    throw util::IntegrityError(Join(unique.violations, "; "), "unique");
  }

  CheckReferences(collection, data, nullptr);
  CheckBusinessRules(collection, data, nullptr, "");

  return engine_->Create(collection, data);
}

std::optional<document::Document> ValidatedStore::UpdateValidated(const std::string& collection, const std::string& id,
                                                                  const document::Document& patch) {
  const auto result = schemas_.ValidatePartial(collection, patch);
  if (!result.valid) {
    throw util::ValidationError(FormatErrors(result.errors), result.errors.front().path, result.errors);
  }

  const auto existing = engine_->Get(collection, id);
  if (!existing) return std::nullopt;

  const auto merged = Overlay(*existing, patch);

  const auto unique = UniqueViolations(collection, merged, id, &patch);
  if (!unique.violations.empty()) {
    throw util::IntegrityError(Join(unique.violations, "; "), "unique");
  }

  CheckReferences(collection, merged, &patch);
  CheckBusinessRules(collection, merged, &patch, id);

  return engine_->Update(collection, id, patch);
}

bool ValidatedStore::DeleteValidated(const std::string& collection, const std::string& id) {
  const auto check = CheckDeleteConstraints(collection, id);
  if (!check.can_delete) {
    throw util::IntegrityError("Cannot delete: referenced by " + Join(check.blocked_by, ", "), "foreign_key", check.blocked_by);
  }

  HandleDeleteCascade(collection, id);
  return engine_->Delete(collection, id);
}

// ------------------------------------------------------------
// Referential integrity
// ------------------------------------------------------------

bool ValidatedStore::CheckReferenceExists(const std::string& collection, const std::string& id) {
  return engine_->Get(collection, id).has_value();
}

DeleteCheck ValidatedStore::CheckDeleteConstraints(const std::string& collection, const std::string& id) {
  DeleteCheck check;
  for (const auto& constraint : references_) {
    if (constraint.target_collection != collection || constraint.on_delete != OnDelete::Restrict) continue;

    if (engine_->Count(constraint.source_collection, FieldEquals(constraint.source_field, id)) > 0 &&
        std::find(check.blocked_by.begin(), check.blocked_by.end(), constraint.source_collection) == check.blocked_by.end()) {
      check.blocked_by.push_back(constraint.source_collection);
    }
  }
  check.can_delete = check.blocked_by.empty();
  return check;
}

void ValidatedStore::HandleDeleteCascade(const std::string& collection, const std::string& id) {
  for (const auto& constraint : references_) {
    if (constraint.target_collection != collection) continue;

    if (constraint.on_delete == OnDelete::Cascade) {
      const auto removed = engine_->DeleteMany(constraint.source_collection, FieldEquals(constraint.source_field, id));
      if (removed > 0) {
        PRACTICEDB_LOG_INFO("cascade delete", {observability::CollectionField(constraint.source_collection),
                                               observability::StringField("parent", id), observability::CountField("removed", removed)});
      }
    } else if (constraint.on_delete == OnDelete::SetNull) {
      db::QueryOptions options;
      options.where = FieldEquals(constraint.source_field, id);
      options.limit = std::numeric_limits<std::size_t>::max();

      document::Document patch;
      document::SetNull(patch, constraint.source_field);
      for (const auto& ref : engine_->Query(constraint.source_collection, options).data) {
        engine_->Update(constraint.source_collection, document::DocumentId(ref), patch);
      }
    }
  }
}

void ValidatedStore::CheckReferences(const std::string& collection, const document::Document& doc, const document::Document* patch) {
  for (const auto& constraint : references_) {
    if (constraint.source_collection != collection) continue;
    if (patch && !document::FindField(*patch, constraint.source_field)) continue;

    const auto* value = document::FindField(doc, constraint.source_field);
    if (document::IsNullOrAbsent(value)) continue;

    const auto ref = ReferenceKey(value);
    if (!CheckReferenceExists(constraint.target_collection, ref)) {
      throw util::IntegrityError("Referenced document " + ref + " not found in " + constraint.target_collection, "foreign_key");
    }
  }
}

// ------------------------------------------------------------
// Unique constraints
// ------------------------------------------------------------

UniqueCheck ValidatedStore::CheckUniqueConstraints(const std::string& collection, const document::Document& data, const std::string& exclude_id) {
  return UniqueViolations(collection, data, exclude_id, nullptr);
}

UniqueCheck ValidatedStore::UniqueViolations(const std::string& collection, const document::Document& data, const std::string& exclude_id,
                                             const document::Document* patch) {
  UniqueCheck check;
  for (const auto& constraint : uniques_) {
    if (constraint.collection != collection) continue;
    if (patch && std::none_of(constraint.fields.begin(), constraint.fields.end(),
                              [&](const std::string& f) { return document::FindField(*patch, f) != nullptr; })) {
      continue;
    }

    std::vector<const document::Value*> values;
    for (const auto& field : constraint.fields) values.push_back(document::FindField(data, field));
    if (std::any_of(values.begin(), values.end(), [](const document::Value* v) { return document::IsNullOrAbsent(v); })) continue;

    const auto matches = engine_->Count(collection, db::Predicate([&](const document::Document& doc) {
                                          if (!exclude_id.empty() && document::DocumentId(doc) == exclude_id) return false;
                                          for (std::size_t i = 0; i < constraint.fields.size(); ++i) {
                                            const auto* v = document::FindField(doc, constraint.fields[i]);
                                            if (!v || !document::ValueEquals(*v, *values[i])) return false;
                                          }
                                          return true;
                                        }));
    if (matches > 0) {
      check.violations.push_back(Join(constraint.fields, ", ") + " must be unique");
    }
  }
  check.valid = check.violations.empty();
  return check;
}

// ------------------------------------------------------------
// Business rules
// ------------------------------------------------------------

void ValidatedStore::CheckBusinessRules(const std::string& collection, const document::Document& doc, const document::Document* patch,
                                        const std::string& exclude_id) {
  if (collection == c::kAppointments) {
    if (Touches(patch, {"doctorId", "date", "time", "endTime", "status"})) {
      const auto result = ValidateAppointmentTime(*engine_, doc, exclude_id);
      if (!result.valid) throw util::ValidationError(result.error, "time");
    }

    const auto code = Str(doc, "procedureCode");
    if (!code.empty() && Touches(patch, {"procedureCode", "patientId"})) {
      if (const auto patient = engine_->Get(c::kPatients, Str(doc, "patientId"))) {
        const auto result = ValidatePatientAge(*patient, code);
        if (!result.valid) throw util::ValidationError(result.error, "procedureCode");
      }
    }
    return;
  }

  if (collection == c::kClaims) {
    if (Touches(patch, {"patientId", "serviceDate"})) {
      const auto result = ValidatePatientInsurance(*engine_, Str(doc, "patientId"), Str(doc, "serviceDate"));
      if (!result.valid) throw util::ValidationError(result.error, "insurance");
    }

    if (Touches(patch, {"services", "amount"})) {
      const auto result = ValidateClaimAmount(doc);
      if (!result.valid) throw util::ValidationError(result.error, "amount");
    }

    if (Touches(patch, {"services", "patientId"})) {
      const auto  patient  = engine_->Get(c::kPatients, Str(doc, "patientId"));
      const auto* services = document::FindField(doc, "services");
      if (!patient || !services || !services->has_list_value()) return;

      for (const auto& service : services->list_value().values()) {
        if (!service.has_struct_value()) continue;
        const auto result = ValidatePatientAge(*patient, Str(service.struct_value(), "serviceCode"));
        if (!result.valid) throw util::ValidationError(result.error, "services");
      }
    }
  }
}

// ------------------------------------------------------------
// Integrity reports
// ------------------------------------------------------------

IntegrityReport ValidatedStore::RunIntegrityCheck(const std::string& collection) {
  IntegrityReport report;
  report.collection = collection;

  const auto docs      = engine_->GetAll(collection);
  report.total_records = docs.size();

  for (const auto& constraint : references_) {
    if (constraint.source_collection != collection) continue;

    std::unordered_set<std::string> targets;
    for (const auto& target : engine_->GetAll(constraint.target_collection)) targets.insert(document::DocumentId(target));

    for (const auto& doc : docs) {
      const auto* value = document::FindField(doc, constraint.source_field);
      if (document::IsNullOrAbsent(value)) continue;

      const auto ref = ReferenceKey(value);
      if (targets.count(ref)) continue;
      report.issues.push_back(
          {document::DocumentId(doc), IssueType::Orphan, constraint.source_field, "Referenced document " + ref + " not found in " + constraint.target_collection});
    }
  }

  if (schemas_.Has(collection)) {
    for (const auto& doc : docs) {
      for (const auto& error : schemas_.Validate(collection, doc).errors) {
        report.issues.push_back({document::DocumentId(doc), IssueType::SchemaViolation, error.path, error.message});
      }
    }
  }

  for (const auto& constraint : uniques_) {
    if (constraint.collection != collection) continue;

    std::unordered_map<std::string, std::string> first_seen;
    for (const auto& doc : docs) {
      std::string key;
      bool        complete = true;
      for (const auto& field : constraint.fields) {
        const auto* v = document::FindField(doc, field);
        if (document::IsNullOrAbsent(v)) {
          complete = false;
          break;
        }
        key += document::ValueKey(v) + '\x1f';
      }
      if (!complete) continue;

      const auto [it, inserted] = first_seen.emplace(key, document::DocumentId(doc));
      if (!inserted) {
        report.issues.push_back({document::DocumentId(doc), IssueType::UniqueViolation, Join(constraint.fields, ", "),
                                 Join(constraint.fields, ", ") + " duplicates document " + it->second});
      }
    }
  }

  return report;
}

std::vector<IntegrityReport> ValidatedStore::RunFullIntegrityCheck() {
  std::vector<IntegrityReport> reports;
  for (const auto& collection : db::DomainCollections()) {
    reports.push_back(RunIntegrityCheck(collection));
  }
  return reports;
}

} // namespace practicedb::validation
