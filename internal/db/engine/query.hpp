#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/document/value.hpp"

namespace practicedb::db {

using Predicate = std::function<bool(const document::Document&)>;

/*
  Filter for Query/Count/DeleteMany.

    monostate → every document
    Document  → AND of deep-equal top-level fields
    Predicate → arbitrary caller test
*/
using Where = std::variant<std::monostate, document::Document, Predicate>;

bool Matches(const Where& where, const document::Document& doc);

enum class SortDirection { Asc, Desc };

struct QueryOptions {
  Where                      where;
  std::optional<std::string> order_by;
  SortDirection              order_direction = SortDirection::Asc;
  std::size_t                limit           = 50;
  std::size_t                offset          = 0;

  // Projection; include wins when both are set.
  std::vector<std::string> include;
  std::vector<std::string> exclude;
};

struct QueryResult {
  std::vector<document::Document> data;
  std::size_t                     total       = 0;
  std::size_t                     page        = 1;
  std::size_t                     page_size   = 0;
  std::size_t                     total_pages = 0;
};

struct AggregateSpec {
  bool                       count = false;
  std::optional<std::string> sum;
  std::optional<std::string> avg;
  std::optional<std::string> min;
  std::optional<std::string> max;
};

struct AggregateRow {
  document::Value                group;
  std::optional<uint64_t>        count;
  std::optional<double>          sum;
  std::optional<double>          avg;
  std::optional<document::Value> min;
  std::optional<document::Value> max;
};

struct DocumentPatch {
  std::string        id;
  document::Document data;
};

} // namespace practicedb::db
