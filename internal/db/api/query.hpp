#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/api/document.hpp"

namespace jobstore::db {

/*
  Filter expression understood by every backend.

  A query is a conjunction of predicates over top-level body fields
  (lowerCamel JSON names), optionally restricted to one document type,
  ordered by one field and limited.

  Memory:   evaluated against the protobuf Struct
  SQLite:   json_extract(body, '$.field')
  Postgres: body->'field' compared as jsonb
*/

enum class CompareOp { Eq, Ne, Lt, Le, Gt, Ge };

using Value = std::variant<std::string, double, bool>;

struct Predicate {
  std::string field;
  CompareOp   op = CompareOp::Eq;
  Value       value;
};

struct OrderBy {
  std::string field;
  bool        descending = false;
};

struct DocumentQuery {
  std::optional<std::string> document_type;
  std::vector<Predicate>     where;
  std::optional<OrderBy>     order_by;
  std::optional<int64_t>     limit;

  DocumentQuery& OfType(std::string type) {
    document_type = std::move(type);
    return *this;
  }

  DocumentQuery& Where(std::string field, CompareOp op, Value value) {
    where.push_back({std::move(field), op, std::move(value)});
    return *this;
  }

  DocumentQuery& Where(std::string field, Value value) {
    return Where(std::move(field), CompareOp::Eq, std::move(value));
  }

  DocumentQuery& OrderedBy(std::string field, bool desc = false) {
    order_by = OrderBy{std::move(field), desc};
    return *this;
  }

  DocumentQuery& Limit(int64_t n) {
    limit = n;
    return *this;
  }
};

struct QueryOptions {
  // Restricts the query to one partition; empty means cross-partition.
  std::optional<std::string> partition_key;

  // Opaque token from a previous QueryPage; empty starts from the beginning.
  std::string continuation;

  int32_t page_size = 100;
};

struct QueryPage {
  std::vector<Document> documents;

  // Empty when there are no further pages.
  std::string continuation;
};

// Offset-based continuation tokens shared by the built-in backends.
std::string EncodeContinuation(int64_t offset);
int64_t     DecodeContinuation(const std::string& token);

} // namespace jobstore::db
