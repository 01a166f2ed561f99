#include "schema_registry.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace practicedb::schema {

namespace {

using document::Value;

const char* Received(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      return "string";
    case Value::kNumberValue:
      return "number";
    case Value::kBoolValue:
      return "boolean";
    case Value::kStructValue:
      return "object";
    case Value::kListValue:
      return "array";
    default:
      return "null";
  }
}

std::string Join(const std::string& path, const std::string& segment) {
  return path.empty() ? segment : path + "." + segment;
}

std::string FormatBound(double v) {
  std::ostringstream out;
  out << v;
  return out.str();
}

// local@domain.tld, no whitespace
bool LooksLikeEmail(const std::string& s) {
  const auto at = s.find('@');
  if (at == std::string::npos || at == 0 || s.find('@', at + 1) != std::string::npos) return false;
  const auto dot = s.find('.', at + 2);
  if (dot == std::string::npos || dot + 1 >= s.size()) return false;
  return s.find_first_of(" \t\r\n") == std::string::npos;
}

void Add(std::vector<util::FieldError>& errors, const std::string& path, std::string message) {
  errors.push_back(util::FieldError{path, std::move(message)});
}

void ValidateString(const FieldSpec& spec, const std::string& s, const std::string& path, std::vector<util::FieldError>& errors) {
  if (spec.literal && s != *spec.literal) {
    Add(errors, path, "Invalid literal value, expected \"" + *spec.literal + "\"");
    return;
  }

  if (!spec.enum_values.empty()) {
    bool found = false;
    for (const auto& option : spec.enum_values) found = found || option == s;
    if (!found) {
      std::string expected;
      for (const auto& option : spec.enum_values) {
        if (!expected.empty()) expected += " | ";
        expected += "'" + option + "'";
      }
      Add(errors, path, "Invalid enum value. Expected " + expected + ", received '" + s + "'");
    }
    return;
  }

  if (spec.min_length && s.size() < *spec.min_length) {
    Add(errors, path, "String must contain at least " + std::to_string(*spec.min_length) + " character(s)");
  }
  if (spec.email && !LooksLikeEmail(s)) {
    Add(errors, path, "Invalid email");
  }
}

void ValidateNumber(const FieldSpec& spec, double n, const std::string& path, std::vector<util::FieldError>& errors) {
  if (!std::isfinite(n)) {
    Add(errors, path, "Expected number, received nan");
    return;
  }
  if (spec.integer && n != std::floor(n)) {
    Add(errors, path, "Expected integer, received float");
  }
  if (spec.min && n < *spec.min) {
    Add(errors, path, "Number must be greater than or equal to " + FormatBound(*spec.min));
  }
  if (spec.max && n > *spec.max) {
    Add(errors, path, "Number must be less than or equal to " + FormatBound(*spec.max));
  }
}

void ValidateFields(const FieldSpec& spec, const document::Document& doc, const std::string& path, bool all_optional,
                    std::vector<util::FieldError>& errors) {
  for (const auto& [name, child] : spec.fields) {
    const auto* value = document::FindField(doc, name);
    if (!value && (all_optional || !child.required)) continue;
    ValidateValue(child, value, Join(path, name), errors);
  }
}

} // namespace

const char* ToString(FieldKind kind) {
  switch (kind) {
    case FieldKind::String:
      return "string";
    case FieldKind::Number:
      return "number";
    case FieldKind::Boolean:
      return "boolean";
    case FieldKind::Object:
      return "object";
    case FieldKind::Array:
      return "array";
    case FieldKind::Any:
      return "any";
  }
  return "any";
}

// ------------------------------------------------------------
// Builders
// ------------------------------------------------------------

FieldSpec String() {
  FieldSpec spec;
  spec.kind = FieldKind::String;
  return spec;
}

FieldSpec Number() {
  FieldSpec spec;
  spec.kind = FieldKind::Number;
  return spec;
}

FieldSpec Boolean() {
  FieldSpec spec;
  spec.kind = FieldKind::Boolean;
  return spec;
}

FieldSpec Any() {
  return FieldSpec{};
}

FieldSpec Enum(std::vector<std::string> values) {
  auto spec        = String();
  spec.enum_values = std::move(values);
  return spec;
}

FieldSpec Literal(std::string value) {
  auto spec    = String();
  spec.literal = std::move(value);
  return spec;
}

FieldSpec Object(std::vector<std::pair<std::string, FieldSpec>> fields) {
  FieldSpec spec;
  spec.kind   = FieldKind::Object;
  spec.fields = std::move(fields);
  return spec;
}

FieldSpec ArrayOf(FieldSpec element) {
  FieldSpec spec;
  spec.kind = FieldKind::Array;
  spec.element.push_back(std::move(element));
  return spec;
}

// ------------------------------------------------------------
// Validation
// ------------------------------------------------------------

void ValidateValue(const FieldSpec& spec, const Value* value, const std::string& path, std::vector<util::FieldError>& errors) {
  if (!value) {
    if (spec.required) Add(errors, path, "Required");
    return;
  }

  if (document::IsNullOrAbsent(value)) {
    if (!spec.nullable && spec.kind != FieldKind::Any) {
      Add(errors, path, std::string("Expected ") + ToString(spec.kind) + ", received null");
    }
    return;
  }

  switch (spec.kind) {
    case FieldKind::Any:
      return;

    case FieldKind::String:
      if (!value->has_string_value()) {
        Add(errors, path, std::string("Expected string, received ") + Received(*value));
        return;
      }
      ValidateString(spec, value->string_value(), path, errors);
      return;

    case FieldKind::Number:
      if (value->kind_case() != Value::kNumberValue) {
        Add(errors, path, std::string("Expected number, received ") + Received(*value));
        return;
      }
      ValidateNumber(spec, value->number_value(), path, errors);
      return;

    case FieldKind::Boolean:
      if (value->kind_case() != Value::kBoolValue) {
        Add(errors, path, std::string("Expected boolean, received ") + Received(*value));
      }
      return;

    case FieldKind::Object:
      if (!value->has_struct_value()) {
        Add(errors, path, std::string("Expected object, received ") + Received(*value));
        return;
      }
      ValidateFields(spec, value->struct_value(), path, false, errors);
      return;

    case FieldKind::Array:
      if (!value->has_list_value()) {
        Add(errors, path, std::string("Expected array, received ") + Received(*value));
        return;
      }
      if (spec.element.empty()) return;
      for (int i = 0; i < value->list_value().values_size(); ++i) {
        ValidateValue(spec.element.front(), &value->list_value().values(i), Join(path, std::to_string(i)), errors);
      }
      return;
  }
}

// ------------------------------------------------------------
// Registry
// ------------------------------------------------------------

void SchemaRegistry::Register(const std::string& collection, FieldSpec root) {
  if (root.kind != FieldKind::Object) {
    throw std::invalid_argument("schema root for " + collection + " must be an object");
  }
  schemas_[collection] = std::move(root);
}

bool SchemaRegistry::Has(const std::string& collection) const {
  return schemas_.count(collection) > 0;
}

ValidationResult SchemaRegistry::Validate(const std::string& collection, const document::Document& doc) const {
  ValidationResult result;
  auto             it = schemas_.find(collection);
  if (it == schemas_.end()) return result;

  ValidateFields(it->second, doc, "", false, result.errors);
  result.valid = result.errors.empty();
  return result;
}

ValidationResult SchemaRegistry::ValidatePartial(const std::string& collection, const document::Document& patch) const {
  ValidationResult result;
  auto             it = schemas_.find(collection);
  if (it == schemas_.end()) return result;

  ValidateFields(it->second, patch, "", true, result.errors);
  result.valid = result.errors.empty();
  return result;
}

std::vector<std::string> SchemaRegistry::Collections() const {
  std::vector<std::string> names;
  for (const auto& [name, spec] : schemas_) names.push_back(name);
  return names;
}

} // namespace practicedb::schema
