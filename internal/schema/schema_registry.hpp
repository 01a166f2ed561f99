#pragma once

#include <map>
#include <string>
#include <vector>

#include "field_spec.hpp"
#include "internal/document/value.hpp"
#include "internal/util/errors.hpp"

namespace practicedb::schema {

struct ValidationResult {
  bool                          valid = true;
  std::vector<util::FieldError> errors;
};

/*
  Per-collection structural validators.

  Validate checks a full document; ValidatePartial treats every
  top-level field as optional (update patches) while nested objects
  that are present must still be complete. Collections without a
  registered schema always validate.
*/
class SchemaRegistry {
 public:
  void Register(const std::string& collection, FieldSpec root);
  bool Has(const std::string& collection) const;

  ValidationResult Validate(const std::string& collection, const document::Document& doc) const;
  ValidationResult ValidatePartial(const std::string& collection, const document::Document& patch) const;

  std::vector<std::string> Collections() const;

 private:
  std::map<std::string, FieldSpec> schemas_;
};

// Validates one value against spec; errors carry dotted paths.
void ValidateValue(const FieldSpec& spec, const document::Value* value, const std::string& path, std::vector<util::FieldError>& errors);

// Schemas for every domain collection.
SchemaRegistry BuildDefaultSchemas();

} // namespace practicedb::schema
