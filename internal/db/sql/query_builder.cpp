#include "query_builder.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace jobstore::db::sql {

namespace {

const char* OpSql(Dialect dialect, CompareOp op) {
  switch (op) {
    case CompareOp::Eq:
      return " = ";
    case CompareOp::Ne:
      // a missing field counts as different, like the in-memory backend
      return dialect == Dialect::Sqlite ? " IS NOT " : " IS DISTINCT FROM ";
    case CompareOp::Lt:
      return " < ";
    case CompareOp::Le:
      return " <= ";
    case CompareOp::Gt:
      return " > ";
    case CompareOp::Ge:
      return " >= ";
  }
  throw std::invalid_argument("unknown comparison operator");
}

std::string JsonString(const std::string& s) {
  std::string out = "\"";
  for (unsigned char c : s) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  out += "\"";
  return out;
}

std::string JsonNumber(double d) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.17g", d);
  return buf;
}

std::string FieldSql(Dialect dialect, const std::string& field) {
  ValidateFieldName(field);
  if (dialect == Dialect::Sqlite) {
    return "json_extract(body,'$." + field + "')";
  }
  return "(body->'" + field + "')";
}

Param ValueParam(Dialect dialect, const Value& value) {
  if (dialect == Dialect::Sqlite) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* d = std::get_if<double>(&value)) return *d;
    return static_cast<int64_t>(std::get<bool>(value) ? 1 : 0);
  }

  // postgres compares jsonb to jsonb
  if (const auto* s = std::get_if<std::string>(&value)) return JsonString(*s);
  if (const auto* d = std::get_if<double>(&value)) return JsonNumber(*d);
  return std::string(std::get<bool>(value) ? "true" : "false");
}

} // namespace

void ValidateFieldName(const std::string& field) {
  if (field.empty()) {
    throw std::invalid_argument("empty field name in document query");
  }
  for (unsigned char c : field) {
    if (!std::isalnum(c) && c != '_') {
      throw std::invalid_argument("invalid field name in document query: " + field);
    }
  }
}

std::string TableName(const std::string& collection) {
  std::string name = "docs_";
  for (unsigned char c : collection) {
    name += std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_';
  }
  return "\"" + name + "\"";
}

std::vector<std::string> CreateCollectionSql(Dialect dialect, const std::string& collection) {
  const auto table = TableName(collection);
  // index names derive from the unquoted table name
  const auto bare = table.substr(1, table.size() - 2);

  if (dialect == Dialect::Sqlite) {
    return {
        "CREATE TABLE IF NOT EXISTS " + table +
            " (partition_key TEXT NOT NULL, id TEXT NOT NULL, document_type TEXT NOT NULL, etag TEXT NOT NULL, ts_ms INTEGER NOT NULL,"
            " expire_at_ms INTEGER, body TEXT NOT NULL, PRIMARY KEY (partition_key, id));",
        "CREATE INDEX IF NOT EXISTS \"" + bare + "_type\" ON " + table + " (document_type);",
        "CREATE INDEX IF NOT EXISTS \"" + bare + "_expire\" ON " + table + " (expire_at_ms);",
    };
  }

  return {
      "CREATE TABLE IF NOT EXISTS " + table +
          " (partition_key TEXT NOT NULL, id TEXT NOT NULL, document_type TEXT NOT NULL, etag TEXT NOT NULL, ts_ms BIGINT NOT NULL,"
          " expire_at_ms BIGINT, body JSONB NOT NULL, PRIMARY KEY (partition_key, id));",
      "CREATE INDEX IF NOT EXISTS \"" + bare + "_type\" ON " + table + " (document_type);",
      "CREATE INDEX IF NOT EXISTS \"" + bare + "_expire\" ON " + table + " (expire_at_ms);",
      "CREATE INDEX IF NOT EXISTS \"" + bare + "_body\" ON " + table + " USING GIN (body jsonb_path_ops);",
  };
}

std::string Placeholder(Dialect dialect, int index) {
  return dialect == Dialect::Sqlite ? "?" : "$" + std::to_string(index);
}

SqlFragment BuildWhere(Dialect dialect, const DocumentQuery& query, const std::optional<std::string>& partition_key, int64_t now_ms,
                       int first_placeholder) {
  SqlFragment out;
  int         next = first_placeholder;

  auto add = [&](const std::string& clause_prefix, const std::string& cast, Param param) {
    if (!out.sql.empty()) out.sql += " AND ";
    out.sql += clause_prefix + Placeholder(dialect, next++) + cast;
    out.params.push_back(std::move(param));
  };

  add("(expire_at_ms IS NULL OR expire_at_ms > ", ")", now_ms);

  if (partition_key) {
    add("partition_key = ", "", *partition_key);
  }
  if (query.document_type) {
    add("document_type = ", "", *query.document_type);
  }

  const std::string cast = dialect == Dialect::Postgres ? "::jsonb" : "";
  for (const auto& predicate : query.where) {
    add(FieldSql(dialect, predicate.field) + OpSql(dialect, predicate.op), cast, ValueParam(dialect, predicate.value));
  }
  return out;
}

std::string BuildOrderBy(Dialect dialect, const DocumentQuery& query) {
  if (!query.order_by) {
    return " ORDER BY partition_key, id";
  }
  const auto dir = query.order_by->descending ? " DESC" : " ASC";
  return " ORDER BY " + FieldSql(dialect, query.order_by->field) + dir + ", partition_key, id";
}

} // namespace jobstore::db::sql
