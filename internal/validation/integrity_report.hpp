#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/document/value.hpp"

namespace practicedb::validation {

enum class IssueType { Orphan, SchemaViolation, UniqueViolation, DataInconsistency };

const char* ToString(IssueType type);

struct IntegrityIssue {
  std::string document_id;
  IssueType   type = IssueType::Orphan;
  std::string field;
  std::string message;
};

struct IntegrityReport {
  std::string                 collection;
  std::size_t                 total_records = 0;
  std::vector<IntegrityIssue> issues;
};

document::Document ToDocument(const IntegrityReport& report);

} // namespace practicedb::validation
