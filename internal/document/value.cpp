#include "value.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace practicedb::document {

namespace {

int KindRank(const Value* v) {
  if (!v) return 0;
  switch (v->kind_case()) {
    case Value::kNullValue:
    case Value::KIND_NOT_SET:
      return 0;
    case Value::kBoolValue:
      return 1;
    case Value::kNumberValue:
      return 2;
    case Value::kStringValue:
      return 3;
    case Value::kListValue:
      return 4;
    case Value::kStructValue:
      return 5;
  }
  return 0;
}

std::string FormatNumber(double n) {
  if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 1e15) {
    return std::to_string(static_cast<long long>(n));
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", n);
  return buf;
}

} // namespace

Value StringValue(std::string_view s) {
  Value v;
  v.set_string_value(std::string(s));
  return v;
}

Value NumberValue(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value BoolValue(bool b) {
  Value v;
  v.set_bool_value(b);
  return v;
}

Value NullValue() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

Value StructValue(const Document& doc) {
  Value v;
  *v.mutable_struct_value() = doc;
  return v;
}

Value ListValue(const std::vector<Document>& docs) {
  return FromDocuments(docs);
}

const Value* FindField(const Document& doc, std::string_view name) {
  const auto& fields = doc.fields();
  auto        it     = fields.find(std::string(name));
  if (it == fields.end()) return nullptr;
  return &it->second;
}

const Value* FindPath(const Document& doc, std::string_view path) {
  const Document* current = &doc;
  const Value*    value   = nullptr;

  std::size_t start = 0;
  while (start <= path.size()) {
    const auto        dot     = path.find('.', start);
    const auto        segment = path.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
    const bool        last    = dot == std::string_view::npos;

    if (current) {
      value = FindField(*current, segment);
    } else if (value && value->has_list_value()) {
      char*       end   = nullptr;
      std::string token(segment);
      const long  index = std::strtol(token.c_str(), &end, 10);
      if (token.empty() || *end != '\0' || index < 0 || index >= value->list_value().values_size()) return nullptr;
      value = &value->list_value().values(static_cast<int>(index));
    } else {
      return nullptr;
    }

    if (!value || last) return value;

    current = value->has_struct_value() ? &value->struct_value() : nullptr;
    start   = dot + 1;
  }
  return value;
}

std::string DocumentId(const Document& doc) {
  return StringField(doc, kIdField).value_or("");
}

std::optional<std::string> StringField(const Document& doc, std::string_view name) {
  const auto* v = FindField(doc, name);
  if (!v || !v->has_string_value()) return std::nullopt;
  return v->string_value();
}

std::optional<double> NumberField(const Document& doc, std::string_view name) {
  const auto* v = FindField(doc, name);
  if (!v || v->kind_case() != Value::kNumberValue) return std::nullopt;
  return v->number_value();
}

void SetString(Document& doc, const std::string& name, std::string_view value) {
  (*doc.mutable_fields())[name].set_string_value(std::string(value));
}

void SetNumber(Document& doc, const std::string& name, double value) {
  (*doc.mutable_fields())[name].set_number_value(value);
}

void SetNull(Document& doc, const std::string& name) {
  (*doc.mutable_fields())[name].set_null_value(google::protobuf::NULL_VALUE);
}

bool IsNullOrAbsent(const Value* v) {
  return !v || v->kind_case() == Value::kNullValue || v->kind_case() == Value::KIND_NOT_SET;
}

bool ValueEquals(const Value& a, const Value& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

int CompareValues(const Value* a, const Value* b) {
  const int ra = KindRank(a);
  const int rb = KindRank(b);
  if (ra != rb) return ra < rb ? -1 : 1;

  switch (ra) {
    case 1:
      return static_cast<int>(a->bool_value()) - static_cast<int>(b->bool_value());
    case 2:
      if (a->number_value() < b->number_value()) return -1;
      if (a->number_value() > b->number_value()) return 1;
      return 0;
    case 3: {
      const int c = a->string_value().compare(b->string_value());
      return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    case 4:
    case 5: {
      const auto ja = ToJson(*a);
      const auto jb = ToJson(*b);
      const int  c  = ja.compare(jb);
      return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    default:
      return 0;
  }
}

double ToNumberOrZero(const Value* v) {
  if (!v) return 0;
  switch (v->kind_case()) {
    case Value::kNumberValue:
      return std::isfinite(v->number_value()) ? v->number_value() : 0;
    case Value::kBoolValue:
      return v->bool_value() ? 1 : 0;
    case Value::kStringValue: {
      const auto& s = v->string_value();
      if (s.empty()) return 0;
      char*        end = nullptr;
      const double n   = std::strtod(s.c_str(), &end);
      return (end && *end == '\0' && std::isfinite(n)) ? n : 0;
    }
    default:
      return 0;
  }
}

std::string ValueKey(const Value* v) {
  if (!v) return "undefined";
  switch (v->kind_case()) {
    case Value::kStringValue:
      return v->string_value();
    case Value::kNumberValue:
      return FormatNumber(v->number_value());
    case Value::kBoolValue:
      return v->bool_value() ? "true" : "false";
    case Value::kListValue:
    case Value::kStructValue:
      return ToJson(*v);
    default:
      return "null";
  }
}

std::vector<Document> ToDocuments(const Value& list) {
  std::vector<Document> docs;
  if (!list.has_list_value()) return docs;
  docs.reserve(list.list_value().values_size());
  for (const auto& item : list.list_value().values()) {
    if (item.has_struct_value()) docs.push_back(item.struct_value());
  }
  return docs;
}

Value FromDocuments(const std::vector<Document>& docs) {
  Value v;
  auto* list = v.mutable_list_value();
  for (const auto& doc : docs) {
    *list->add_values()->mutable_struct_value() = doc;
  }
  return v;
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize JSON: " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message) {
  auto status = google::protobuf::util::JsonStringToMessage(json, message);
  if (!status.ok()) {
    throw std::runtime_error("Failed to parse JSON: " + std::string(status.message()));
  }
}

Document ParseDocument(const std::string& json) {
  Document doc;
  FromJson(json, &doc);
  return doc;
}

} // namespace practicedb::document
