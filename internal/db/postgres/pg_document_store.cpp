#include "pg_document_store.hpp"

#include <algorithm>
#include <optional>

#include "internal/db/codec/document_codec.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/query_builder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace jobstore::db::postgres {

using sql::Dialect;

namespace {

constexpr const char* kColumns = "partition_key,id,document_type,etag,ts_ms,expire_at_ms,body";

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& work) : work_(work) {
  }

  void ExecuteSQL(const std::string& statement) override {
    work_.exec(statement);
  }

 private:
  pqxx::work& work_;
};

void AppendParams(pqxx::params& out, const sql::Params& params) {
  for (const auto& p : params) {
    if (std::holds_alternative<std::nullptr_t>(p)) {
      out.append();
    } else if (const auto* i = std::get_if<int64_t>(&p)) {
      out.append(*i);
    } else if (const auto* d = std::get_if<double>(&p)) {
      out.append(*d);
    } else {
      out.append(std::get<std::string>(p));
    }
  }
}

void AppendDocument(pqxx::params& out, const Document& doc, const std::string& etag, int64_t now_ms) {
  out.append(doc.partition_key);
  out.append(doc.id);
  out.append(doc.document_type);
  out.append(etag);
  out.append(now_ms);
  out.append(doc.expire_at_ms);
  out.append(codec::StructToJson(doc.body));
}

Document ReadRow(const pqxx::row& row) {
  Document doc;
  doc.partition_key = row[0].c_str();
  doc.id            = row[1].c_str();
  doc.document_type = row[2].c_str();
  doc.etag          = row[3].c_str();
  doc.timestamp_ms  = row[4].as<int64_t>();
  if (!row[5].is_null()) {
    doc.expire_at_ms = row[5].as<int64_t>();
  }
  doc.body = codec::JsonToStruct(row[6].c_str());
  return doc;
}

bool ExistsLive(pqxx::work& work, const std::string& table, const std::string& id, const std::string& partition_key, int64_t now_ms) {
  auto res = work.exec_params("SELECT 1 FROM " + table + " WHERE partition_key=$1 AND id=$2 AND (expire_at_ms IS NULL OR expire_at_ms > $3)",
                              partition_key, id, now_ms);
  return !res.empty();
}

} // namespace

PgDocumentStore::PgDocumentStore(std::shared_ptr<PgPool> pool, util::ClockFn clock) : pool_(std::move(pool)), clock_(std::move(clock)) {
}

Result PgDocumentStore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) || dynamic_cast<const pqxx::in_doubt_error*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (const auto* store = dynamic_cast<const util::StoreError*>(&e)) {
    return Result::Err(store->code(), e.what());
  }
  if (dynamic_cast<const pqxx::failure*>(&e)) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
  // codec or query-building failure
  return Result::Err(ErrorCode::InvalidData, e.what());
}

void PgDocumentStore::EnsureCollection(const std::string& collection) {
  {
    std::scoped_lock lock(collections_mutex_);
    if (known_collections_.count(collection)) return;
  }

  PgTransaction       tx(pool_);
  PgMigrationExecutor executor(tx.Work());
  sql::RunMigrations(executor, sql::CreateCollectionSql(Dialect::Postgres, collection));
  tx.Commit();

  std::scoped_lock lock(collections_mutex_);
  known_collections_.insert(collection);
}

std::optional<Document> PgDocumentStore::Get(const std::string& collection, const std::string& id, const std::string& partition_key) {
  try {
    EnsureCollection(collection);
    PgTransaction tx(pool_);
    auto          res = tx.Work().exec_params(std::string("SELECT ") + kColumns + " FROM " + sql::TableName(collection) +
                                         " WHERE partition_key=$1 AND id=$2 AND (expire_at_ms IS NULL OR expire_at_ms > $3)",
                                     partition_key, id, util::ToUnixMillis(clock_()));
    tx.Commit();
    if (res.empty()) return std::nullopt;
    return ReadRow(res[0]);
  } catch (const std::exception& e) {
    auto r = Translate(e);
    throw util::StoreError(r.code, "postgres get: " + r.message);
  }
}

Result PgDocumentStore::Create(const std::string& collection, Document& doc) {
  try {
    EnsureCollection(collection);
    const auto now_ms = util::ToUnixMillis(clock_());
    const auto etag   = util::ToCompactString(util::GenerateUUID());
    const auto table  = sql::TableName(collection);

    pqxx::params params;
    AppendDocument(params, doc, etag, now_ms);

    PgTransaction tx(pool_);
    auto          res = tx.Work().exec_params("INSERT INTO " + table + " AS t (" + kColumns +
                                         ") VALUES($1,$2,$3,$4,$5,$6,$7::jsonb) ON CONFLICT (partition_key,id) DO UPDATE SET"
                                         " document_type=EXCLUDED.document_type, etag=EXCLUDED.etag, ts_ms=EXCLUDED.ts_ms,"
                                         " expire_at_ms=EXCLUDED.expire_at_ms, body=EXCLUDED.body"
                                         " WHERE t.expire_at_ms IS NOT NULL AND t.expire_at_ms <= EXCLUDED.ts_ms",
                                     params);
    tx.Commit();

    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::AlreadyExists, collection + "/" + doc.partition_key + "/" + doc.id);
    }
    doc.etag         = etag;
    doc.timestamp_ms = now_ms;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgDocumentStore::Upsert(const std::string& collection, Document& doc) {
  try {
    EnsureCollection(collection);
    const auto now_ms = util::ToUnixMillis(clock_());
    const auto etag   = util::ToCompactString(util::GenerateUUID());

    pqxx::params params;
    AppendDocument(params, doc, etag, now_ms);

    PgTransaction tx(pool_);
    tx.Work().exec_params("INSERT INTO " + sql::TableName(collection) + " (" + kColumns +
                              ") VALUES($1,$2,$3,$4,$5,$6,$7::jsonb) ON CONFLICT (partition_key,id) DO UPDATE SET"
                              " document_type=EXCLUDED.document_type, etag=EXCLUDED.etag, ts_ms=EXCLUDED.ts_ms,"
                              " expire_at_ms=EXCLUDED.expire_at_ms, body=EXCLUDED.body",
                          params);
    tx.Commit();

    doc.etag         = etag;
    doc.timestamp_ms = now_ms;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgDocumentStore::Replace(const std::string& collection, Document& doc, const std::optional<std::string>& if_match) {
  try {
    EnsureCollection(collection);
    const auto now_ms = util::ToUnixMillis(clock_());
    const auto etag   = util::ToCompactString(util::GenerateUUID());
    const auto table  = sql::TableName(collection);

    pqxx::params params;
    AppendDocument(params, doc, etag, now_ms);

    std::string statement = "UPDATE " + table +
                            " SET document_type=$3, etag=$4, ts_ms=$5, expire_at_ms=$6, body=$7::jsonb"
                            " WHERE partition_key=$1 AND id=$2 AND (expire_at_ms IS NULL OR expire_at_ms > $5)";
    if (if_match) {
      statement += " AND etag=$8";
      params.append(*if_match);
    }

    PgTransaction tx(pool_);
    auto          res = tx.Work().exec_params(statement, params);
    if (res.affected_rows() == 0) {
      const bool exists = if_match && ExistsLive(tx.Work(), table, doc.id, doc.partition_key, now_ms);
      tx.Commit();
      if (exists) return Result::Err(ErrorCode::Conflict, "etag mismatch for " + doc.id);
      return Result::Err(ErrorCode::NotFound, collection + "/" + doc.partition_key + "/" + doc.id);
    }
    tx.Commit();

    doc.etag         = etag;
    doc.timestamp_ms = now_ms;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgDocumentStore::Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                               const std::optional<std::string>& if_match) {
  try {
    EnsureCollection(collection);
    const auto now_ms = util::ToUnixMillis(clock_());
    const auto table  = sql::TableName(collection);

    PgTransaction tx(pool_);
    if (!if_match) {
      tx.Work().exec_params("DELETE FROM " + table + " WHERE partition_key=$1 AND id=$2", partition_key, id);
      tx.Commit();
      return Result::Ok();
    }

    auto res = tx.Work().exec_params("DELETE FROM " + table +
                                         " WHERE partition_key=$1 AND id=$2 AND (etag=$3 OR (expire_at_ms IS NOT NULL AND expire_at_ms <= $4))",
                                     partition_key, id, *if_match, now_ms);
    if (res.affected_rows() == 0 && ExistsLive(tx.Work(), table, id, partition_key, now_ms)) {
      tx.Commit();
      return Result::Err(ErrorCode::Conflict, "etag mismatch for " + id);
    }
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

QueryPage PgDocumentStore::Query(const std::string& collection, const DocumentQuery& query, const QueryOptions& options) {
  try {
    EnsureCollection(collection);

    const int64_t offset = DecodeContinuation(options.continuation);
    int64_t       limit  = options.page_size > 0 ? options.page_size : -1;
    if (query.limit) {
      const int64_t remaining = std::max<int64_t>(0, *query.limit - offset);
      limit                   = limit < 0 ? remaining : std::min(limit, remaining);
    }

    QueryPage page;
    if (limit == 0) return page;

    auto        where     = sql::BuildWhere(Dialect::Postgres, query, options.partition_key, util::ToUnixMillis(clock_()));
    const int   next      = static_cast<int>(where.params.size()) + 1;
    std::string statement = std::string("SELECT ") + kColumns + " FROM " + sql::TableName(collection) + " WHERE " + where.sql +
                            sql::BuildOrderBy(Dialect::Postgres, query) + " OFFSET " + sql::Placeholder(Dialect::Postgres, next);

    pqxx::params params;
    AppendParams(params, where.params);
    params.append(offset);
    if (limit >= 0) {
      // one extra row tells whether another page exists
      statement += " LIMIT " + sql::Placeholder(Dialect::Postgres, next + 1);
      params.append(limit + 1);
    }

    PgTransaction tx(pool_);
    auto          res = tx.Work().exec_params(statement, params);
    tx.Commit();

    for (const auto& row : res) {
      if (limit >= 0 && static_cast<int64_t>(page.documents.size()) == limit) {
        page.continuation = EncodeContinuation(offset + limit);
        break;
      }
      page.documents.push_back(ReadRow(row));
    }
    if (query.limit && offset + static_cast<int64_t>(page.documents.size()) >= *query.limit) {
      page.continuation.clear();
    }
    return page;
  } catch (const std::exception& e) {
    auto r = Translate(e);
    throw util::StoreError(r.code, "postgres query: " + r.message);
  }
}

int64_t PgDocumentStore::Count(const std::string& collection, const DocumentQuery& query, const std::optional<std::string>& partition_key) {
  try {
    EnsureCollection(collection);

    auto         where = sql::BuildWhere(Dialect::Postgres, query, partition_key, util::ToUnixMillis(clock_()));
    pqxx::params params;
    AppendParams(params, where.params);

    PgTransaction tx(pool_);
    auto          res = tx.Work().exec_params("SELECT COUNT(1) FROM " + sql::TableName(collection) + " WHERE " + where.sql, params);
    tx.Commit();

    const auto count = res[0][0].as<int64_t>();
    return query.limit ? std::min(count, *query.limit) : count;
  } catch (const std::exception& e) {
    auto r = Translate(e);
    throw util::StoreError(r.code, "postgres count: " + r.message);
  }
}

std::size_t PgDocumentStore::PurgeExpired() {
  try {
    PgTransaction tx(pool_);
    auto          tables =
        tx.Work().exec("SELECT tablename FROM pg_tables WHERE schemaname = current_schema() AND tablename LIKE 'docs\\_%'");

    const auto  now_ms  = util::ToUnixMillis(clock_());
    std::size_t removed = 0;
    for (const auto& row : tables) {
      auto res = tx.Work().exec_params("DELETE FROM \"" + std::string(row[0].c_str()) + "\" WHERE expire_at_ms IS NOT NULL AND expire_at_ms <= $1",
                                       now_ms);
      removed += static_cast<std::size_t>(res.affected_rows());
    }
    tx.Commit();
    return removed;
  } catch (const std::exception& e) {
    auto r = Translate(e);
    throw util::StoreError(r.code, "postgres purge: " + r.message);
  }
}

} // namespace jobstore::db::postgres
