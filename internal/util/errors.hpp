#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace practicedb::util {

/*
  Central error types.

  Validated writes throw ValidationError / IntegrityError before touching
  storage. Plain engine primitives prefer optional/bool returns and only
  throw AlreadyExists on a duplicate id.
*/

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct FieldError {
  std::string path;
  std::string message;
};

// Schema violation or failed business rule.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg, std::string field = {}, std::vector<FieldError> details = {})
      : std::runtime_error(msg), field_(std::move(field)), details_(std::move(details)) {
  }

  const std::string& Field() const {
    return field_;
  }

  const std::vector<FieldError>& Details() const {
    return details_;
  }

 private:
  std::string             field_;
  std::vector<FieldError> details_;
};

// Unique or referential constraint violation.
class IntegrityError : public std::runtime_error {
 public:
  IntegrityError(const std::string& msg, std::string constraint, std::vector<std::string> blocked_by = {})
      : std::runtime_error(msg), constraint_(std::move(constraint)), blocked_by_(std::move(blocked_by)) {
  }

  // "unique" or "foreign_key"
  const std::string& Constraint() const {
    return constraint_;
  }

  // Collections holding references that prevent a delete.
  const std::vector<std::string>& BlockedBy() const {
    return blocked_by_;
  }

 private:
  std::string              constraint_;
  std::vector<std::string> blocked_by_;
};

class MigrationError : public std::runtime_error {
 public:
  explicit MigrationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace practicedb::util
