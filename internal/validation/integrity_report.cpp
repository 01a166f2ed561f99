#include "integrity_report.hpp"

namespace practicedb::validation {

const char* ToString(IssueType type) {
  switch (type) {
    case IssueType::Orphan:
      return "orphan";
    case IssueType::SchemaViolation:
      return "schema_violation";
    case IssueType::UniqueViolation:
      return "unique_violation";
    case IssueType::DataInconsistency:
      return "data_inconsistency";
  }
  return "orphan";
}

document::Document ToDocument(const IntegrityReport& report) {
  document::Document doc;
  document::SetString(doc, "collection", report.collection);
  document::SetNumber(doc, "totalRecords", static_cast<double>(report.total_records));

  auto* issues = (*doc.mutable_fields())["issues"].mutable_list_value();
  for (const auto& issue : report.issues) {
    auto* entry = issues->add_values()->mutable_struct_value();
    document::SetString(*entry, "documentId", issue.document_id);
    document::SetString(*entry, "type", ToString(issue.type));
    if (!issue.field.empty()) document::SetString(*entry, "field", issue.field);
    document::SetString(*entry, "message", issue.message);
  }
  return doc;
}

} // namespace practicedb::validation
