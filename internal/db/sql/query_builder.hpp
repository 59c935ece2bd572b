#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace jobstore::db::sql {

enum class Dialect { Sqlite, Postgres };

/*
  One table per collection:

    partition_key, id   primary key
    document_type       discriminator
    etag, ts_ms         store-assigned version and write time
    expire_at_ms        NULL = never expires
    body                JSON text (sqlite) / jsonb (postgres)
*/

// "docs_<sanitized collection>", already quoted
std::string TableName(const std::string& collection);

std::vector<std::string> CreateCollectionSql(Dialect dialect, const std::string& collection);

struct SqlFragment {
  std::string sql;
  Params      params;
};

/*
  WHERE clause (without the keyword) covering partition, liveness,
  document type and predicates. Placeholders continue from
  first_placeholder for postgres.
*/
SqlFragment BuildWhere(Dialect dialect, const DocumentQuery& query, const std::optional<std::string>& partition_key, int64_t now_ms,
                       int first_placeholder = 1);

// " ORDER BY ..." or a stable default ordering on the primary key
std::string BuildOrderBy(Dialect dialect, const DocumentQuery& query);

std::string Placeholder(Dialect dialect, int index);

// Field names become JSON paths; only [A-Za-z0-9_] is accepted.
void ValidateFieldName(const std::string& field);

} // namespace jobstore::db::sql
