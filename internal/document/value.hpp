#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace practicedb::document {

/*
  Documents are JSON objects modelled as google.protobuf.Struct.

  Every persisted value (collections, indexes, metadata, sync log)
  is a google.protobuf.Value, so adapters only ever store one type.
*/

using Document = google::protobuf::Struct;
using Value    = google::protobuf::Value;

inline constexpr const char* kIdField        = "id";
inline constexpr const char* kCreatedAtField = "createdAt";
inline constexpr const char* kUpdatedAtField = "updatedAt";

// ------------------------------------------------------------------
// Construction
// ------------------------------------------------------------------

Value StringValue(std::string_view s);
Value NumberValue(double n);
Value BoolValue(bool b);
Value NullValue();
Value StructValue(const Document& doc);
Value ListValue(const std::vector<Document>& docs);

// ------------------------------------------------------------------
// Field access
// ------------------------------------------------------------------

// nullptr when the field is absent
const Value* FindField(const Document& doc, std::string_view name);

// Dotted path lookup ("insuranceInfo.validTo"); list indexes allowed.
const Value* FindPath(const Document& doc, std::string_view path);

std::string           DocumentId(const Document& doc);
std::optional<std::string> StringField(const Document& doc, std::string_view name);
std::optional<double>      NumberField(const Document& doc, std::string_view name);

void SetString(Document& doc, const std::string& name, std::string_view value);
void SetNumber(Document& doc, const std::string& name, double value);
void SetNull(Document& doc, const std::string& name);

bool IsNullOrAbsent(const Value* v);

// ------------------------------------------------------------------
// Comparison
// ------------------------------------------------------------------

bool ValueEquals(const Value& a, const Value& b);

// Total order: null < bool < number < string < list < struct.
// nullptr (missing field) sorts with null.
int CompareValues(const Value* a, const Value* b);

// Numeric interpretation used by sum/avg: numbers as-is, numeric strings
// parsed, booleans as 0/1, everything else 0.
double ToNumberOrZero(const Value* v);

// Stable textual key for indexes and group-by buckets.
std::string ValueKey(const Value* v);

// ------------------------------------------------------------------
// Collections
// ------------------------------------------------------------------

std::vector<Document> ToDocuments(const Value& list);
Value                 FromDocuments(const std::vector<Document>& docs);

// ------------------------------------------------------------------
// JSON
// ------------------------------------------------------------------

std::string ToJson(const google::protobuf::Message& message);

// Throws std::runtime_error on malformed input.
void FromJson(const std::string& json, google::protobuf::Message* message);

Document ParseDocument(const std::string& json);

} // namespace practicedb::document
