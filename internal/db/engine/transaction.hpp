#pragma once

#include <string>
#include <variant>
#include <vector>

#include "internal/document/value.hpp"

namespace practicedb::db {

/*
  Operations recorded while a transaction is pending. Each carries the
  before-image needed to restore it, so rollback never infers inverses.
*/
struct Created {
  std::string        collection;
  document::Document doc;
};

struct Updated {
  std::string        collection;
  document::Document before;
  document::Document after;
};

struct Deleted {
  std::string        collection;
  document::Document doc;
};

using Operation = std::variant<Created, Updated, Deleted>;

enum class TransactionStatus { Pending, Committed, RolledBack };

const char* ToString(TransactionStatus status);

struct Transaction {
  std::string            id;
  std::vector<Operation> operations;
  TransactionStatus      status = TransactionStatus::Pending;
  std::string            created_at;
};

} // namespace practicedb::db
