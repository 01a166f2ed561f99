#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace practicedb::schema {

enum class FieldKind { String, Number, Boolean, Object, Array, Any };

const char* ToString(FieldKind kind);

/*
  Declarative shape of one JSON value.

  Built with the helpers below and refined fluently:

      Object({
          {"name", String().MinLength(2)},
          {"age", Number().Min(0).Max(150)},
          {"email", String().Email().Optional()},
      })

  Object specs list known fields only; unknown fields are accepted and
  kept.
*/
struct FieldSpec {
  FieldKind kind     = FieldKind::Any;
  bool      required = true;
  bool      nullable = false;

  // String
  std::vector<std::string>   enum_values;
  std::optional<std::size_t> min_length;
  bool                       email = false;
  std::optional<std::string> literal;

  // Number
  std::optional<double> min;
  std::optional<double> max;
  bool                  integer = false;

  // Object
  std::vector<std::pair<std::string, FieldSpec>> fields;

  // Array
  std::vector<FieldSpec> element; // zero or one entry

  FieldSpec Optional() const {
    auto copy     = *this;
    copy.required = false;
    return copy;
  }

  FieldSpec Nullable() const {
    auto copy     = *this;
    copy.nullable = true;
    return copy;
  }

  FieldSpec MinLength(std::size_t n) const {
    auto copy       = *this;
    copy.min_length = n;
    return copy;
  }

  FieldSpec Email() const {
    auto copy  = *this;
    copy.email = true;
    return copy;
  }

  FieldSpec Min(double v) const {
    auto copy = *this;
    copy.min  = v;
    return copy;
  }

  FieldSpec Max(double v) const {
    auto copy = *this;
    copy.max  = v;
    return copy;
  }

  FieldSpec Int() const {
    auto copy    = *this;
    copy.integer = true;
    return copy;
  }
};

FieldSpec String();
FieldSpec Number();
FieldSpec Boolean();
FieldSpec Any();
FieldSpec Enum(std::vector<std::string> values);
FieldSpec Literal(std::string value);
FieldSpec Object(std::vector<std::pair<std::string, FieldSpec>> fields = {});
FieldSpec ArrayOf(FieldSpec element);

} // namespace practicedb::schema
