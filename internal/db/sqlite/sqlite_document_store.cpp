#include "sqlite_document_store.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/db/codec/document_codec.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/query_builder.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace jobstore::db::sqlite {

using jobstore::db::ErrorCode;
using jobstore::db::Result;
using sql::Dialect;

namespace {

constexpr const char* kColumns = "partition_key,id,document_type,etag,ts_ms,expire_at_ms,body";

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& statement) override {
    db_.Exec(statement);
  }

 private:
  SqliteDB& db_;
};

// RAII finalize
struct Statement {
  sqlite3_stmt* st = nullptr;
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindParams(sqlite3_stmt* st, const sql::Params& params, int first = 1) {
  int idx = first;
  for (const auto& p : params) {
    if (std::holds_alternative<std::nullptr_t>(p)) {
      sqlite3_bind_null(st, idx);
    } else if (const auto* i = std::get_if<int64_t>(&p)) {
      BindI64(st, idx, *i);
    } else if (const auto* d = std::get_if<double>(&p)) {
      sqlite3_bind_double(st, idx, *d);
    } else {
      BindText(st, idx, std::get<std::string>(p));
    }
    ++idx;
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

Document ReadRow(sqlite3_stmt* st) {
  Document doc;
  doc.partition_key = ColText(st, 0);
  doc.id            = ColText(st, 1);
  doc.document_type = ColText(st, 2);
  doc.etag          = ColText(st, 3);
  doc.timestamp_ms  = sqlite3_column_int64(st, 4);
  if (sqlite3_column_type(st, 5) != SQLITE_NULL) {
    doc.expire_at_ms = sqlite3_column_int64(st, 5);
  }
  doc.body = codec::JsonToStruct(ColText(st, 6));
  return doc;
}

[[noreturn]] void ThrowRead(const Result& r, const std::string& context) {
  throw util::StoreError(r.code, context + ": " + r.message);
}

ErrorCode CodeFor(int rc) {
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

// sqlite failures keep their code; any other exception (codec, bad query)
// is InvalidData.
Result FromException(const std::exception& e) {
  if (const auto* store = dynamic_cast<const util::StoreError*>(&e)) {
    return Result::Err(store->code(), e.what());
  }
  if (const auto* sqlite = dynamic_cast<const SqliteError*>(&e)) {
    return Result::Err(CodeFor(sqlite->code()), e.what());
  }
  return Result::Err(ErrorCode::InvalidData, e.what());
}

} // namespace

SqliteDocumentStore::SqliteDocumentStore(std::shared_ptr<SqliteDB> db, util::ClockFn clock) : db_(std::move(db)), clock_(std::move(clock)) {
}

Result SqliteDocumentStore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();
  return Result::Err(CodeFor(rc), sqlite3_errmsg(db));
}

void SqliteDocumentStore::EnsureCollectionLocked(const std::string& collection) {
  if (known_collections_.count(collection)) return;

  SqliteMigrationExecutor executor(*db_);
  sql::RunMigrations(executor, sql::CreateCollectionSql(Dialect::Sqlite, collection));
  known_collections_.insert(collection);
}

bool SqliteDocumentStore::ExistsLiveLocked(const std::string& table, const std::string& id, const std::string& partition_key, int64_t now_ms) {
  Statement s;
  s.st = db_->Prepare("SELECT 1 FROM " + table + " WHERE partition_key=? AND id=? AND (expire_at_ms IS NULL OR expire_at_ms > ?);");
  BindText(s.st, 1, partition_key);
  BindText(s.st, 2, id);
  BindI64(s.st, 3, now_ms);

  int rc = sqlite3_step(s.st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  ThrowRead(Translate(db_->Handle(), rc), "sqlite exists");
}

// Binds the seven columns in kColumns order and steps once.
Result SqliteDocumentStore::WriteLocked(const std::string& statement, Document& doc, int64_t now_ms, int* changes) {
  Statement s;
  s.st = db_->Prepare(statement);

  const auto etag = util::ToCompactString(util::GenerateUUID());
  BindText(s.st, 1, doc.partition_key);
  BindText(s.st, 2, doc.id);
  BindText(s.st, 3, doc.document_type);
  BindText(s.st, 4, etag);
  BindI64(s.st, 5, now_ms);
  BindOptionalI64(s.st, 6, doc.expire_at_ms);
  BindText(s.st, 7, codec::StructToJson(doc.body));

  int rc = sqlite3_step(s.st);
  if (rc != SQLITE_DONE) return Translate(db_->Handle(), rc);

  if (changes) *changes = db_->Changes();
  doc.etag         = etag;
  doc.timestamp_ms = now_ms;
  return Result::Ok();
}

std::optional<Document> SqliteDocumentStore::Get(const std::string& collection, const std::string& id, const std::string& partition_key) {
  std::scoped_lock lock(mutex_);
  try {
    EnsureCollectionLocked(collection);

    Statement s;
    s.st = db_->Prepare(std::string("SELECT ") + kColumns + " FROM " + sql::TableName(collection) +
                        " WHERE partition_key=? AND id=? AND (expire_at_ms IS NULL OR expire_at_ms > ?);");
    BindText(s.st, 1, partition_key);
    BindText(s.st, 2, id);
    BindI64(s.st, 3, util::ToUnixMillis(clock_()));

    int rc = sqlite3_step(s.st);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) ThrowRead(Translate(db_->Handle(), rc), "sqlite get");
    return ReadRow(s.st);
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    ThrowRead(FromException(e), "sqlite get");
  }
}

Result SqliteDocumentStore::Create(const std::string& collection, Document& doc) {
  std::scoped_lock lock(mutex_);
  try {
    EnsureCollectionLocked(collection);
    const auto now_ms = util::ToUnixMillis(clock_());
    const auto table  = sql::TableName(collection);

    // an expired row is overwritten in place; a live one wins
    const std::string statement = "INSERT INTO " + table + "(" + kColumns +
                                  ") VALUES(?,?,?,?,?,?,?) ON CONFLICT(partition_key,id) DO UPDATE SET"
                                  " document_type=excluded.document_type, etag=excluded.etag, ts_ms=excluded.ts_ms,"
                                  " expire_at_ms=excluded.expire_at_ms, body=excluded.body"
                                  " WHERE " + table + ".expire_at_ms IS NOT NULL AND " + table + ".expire_at_ms <= excluded.ts_ms;";

    int  changes = 0;
    auto r       = WriteLocked(statement, doc, now_ms, &changes);
    if (!r) return r;
    if (changes == 0) {
      return Result::Err(ErrorCode::AlreadyExists, collection + "/" + doc.partition_key + "/" + doc.id);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return FromException(e);
  }
}

Result SqliteDocumentStore::Upsert(const std::string& collection, Document& doc) {
  std::scoped_lock lock(mutex_);
  try {
    EnsureCollectionLocked(collection);
    const std::string statement = "INSERT INTO " + sql::TableName(collection) + "(" + kColumns +
                                  ") VALUES(?,?,?,?,?,?,?) ON CONFLICT(partition_key,id) DO UPDATE SET"
                                  " document_type=excluded.document_type, etag=excluded.etag, ts_ms=excluded.ts_ms,"
                                  " expire_at_ms=excluded.expire_at_ms, body=excluded.body;";
    return WriteLocked(statement, doc, util::ToUnixMillis(clock_()), nullptr);
  } catch (const std::exception& e) {
    return FromException(e);
  }
}

Result SqliteDocumentStore::Replace(const std::string& collection, Document& doc, const std::optional<std::string>& if_match) {
  std::scoped_lock lock(mutex_);
  try {
    EnsureCollectionLocked(collection);
    const auto now_ms = util::ToUnixMillis(clock_());
    const auto table  = sql::TableName(collection);

    SqliteTransaction tx(db_);

    // parameters 1..7 follow kColumns so WriteLocked can bind them
    std::string statement = "UPDATE " + table +
                            " SET partition_key=?1, id=?2, document_type=?3, etag=?4, ts_ms=?5, expire_at_ms=?6, body=?7"
                            " WHERE partition_key=?1 AND id=?2 AND (expire_at_ms IS NULL OR expire_at_ms > ?5)";
    if (if_match) {
      statement += " AND etag=?8";
    }
    statement += ";";

    Statement s;
    s.st              = db_->Prepare(statement);
    const auto etag   = util::ToCompactString(util::GenerateUUID());
    BindText(s.st, 1, doc.partition_key);
    BindText(s.st, 2, doc.id);
    BindText(s.st, 3, doc.document_type);
    BindText(s.st, 4, etag);
    BindI64(s.st, 5, now_ms);
    BindOptionalI64(s.st, 6, doc.expire_at_ms);
    BindText(s.st, 7, codec::StructToJson(doc.body));
    if (if_match) BindText(s.st, 8, *if_match);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db_->Handle(), rc);

    if (db_->Changes() == 0) {
      const bool exists = if_match && ExistsLiveLocked(table, doc.id, doc.partition_key, now_ms);
      tx.Commit();
      if (exists) return Result::Err(ErrorCode::Conflict, "etag mismatch for " + doc.id);
      return Result::Err(ErrorCode::NotFound, collection + "/" + doc.partition_key + "/" + doc.id);
    }

    tx.Commit();
    doc.etag         = etag;
    doc.timestamp_ms = now_ms;
    return Result::Ok();
  } catch (const std::exception& e) {
    return FromException(e);
  }
}

Result SqliteDocumentStore::Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                                   const std::optional<std::string>& if_match) {
  std::scoped_lock lock(mutex_);
  try {
    EnsureCollectionLocked(collection);
    const auto now_ms = util::ToUnixMillis(clock_());
    const auto table  = sql::TableName(collection);

    SqliteTransaction tx(db_);

    std::string statement = "DELETE FROM " + table + " WHERE partition_key=?1 AND id=?2";
    if (if_match) {
      statement += " AND (etag=?3 OR (expire_at_ms IS NOT NULL AND expire_at_ms <= ?4))";
    }
    statement += ";";

    Statement s;
    s.st = db_->Prepare(statement);
    BindText(s.st, 1, partition_key);
    BindText(s.st, 2, id);
    if (if_match) {
      BindText(s.st, 3, *if_match);
      BindI64(s.st, 4, now_ms);
    }

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_DONE) return Translate(db_->Handle(), rc);

    if (if_match && db_->Changes() == 0 && ExistsLiveLocked(table, id, partition_key, now_ms)) {
      tx.Commit();
      return Result::Err(ErrorCode::Conflict, "etag mismatch for " + id);
    }
    tx.Commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return FromException(e);
  }
}

QueryPage SqliteDocumentStore::Query(const std::string& collection, const DocumentQuery& query, const QueryOptions& options) {
  std::scoped_lock lock(mutex_);
  try {
    EnsureCollectionLocked(collection);

    const int64_t offset = DecodeContinuation(options.continuation);
    int64_t       limit  = options.page_size > 0 ? options.page_size : -1;
    if (query.limit) {
      const int64_t remaining = std::max<int64_t>(0, *query.limit - offset);
      limit                   = limit < 0 ? remaining : std::min(limit, remaining);
    }

    QueryPage page;
    if (limit == 0) return page;

    auto where = sql::BuildWhere(Dialect::Sqlite, query, options.partition_key, util::ToUnixMillis(clock_()));

    // one extra row tells whether another page exists
    const std::string statement = std::string("SELECT ") + kColumns + " FROM " + sql::TableName(collection) + " WHERE " + where.sql +
                                  sql::BuildOrderBy(Dialect::Sqlite, query) + " LIMIT ? OFFSET ?;";

    Statement s;
    s.st = db_->Prepare(statement);
    BindParams(s.st, where.params);
    const int next = static_cast<int>(where.params.size()) + 1;
    BindI64(s.st, next, limit < 0 ? -1 : limit + 1);
    BindI64(s.st, next + 1, offset);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) {
      if (limit >= 0 && static_cast<int64_t>(page.documents.size()) == limit) {
        page.continuation = EncodeContinuation(offset + limit);
        break;
      }
      page.documents.push_back(ReadRow(s.st));
    }
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) ThrowRead(Translate(db_->Handle(), rc), "sqlite query");

    if (query.limit && offset + static_cast<int64_t>(page.documents.size()) >= *query.limit) {
      page.continuation.clear();
    }
    return page;
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    ThrowRead(FromException(e), "sqlite query");
  }
}

int64_t SqliteDocumentStore::Count(const std::string& collection, const DocumentQuery& query, const std::optional<std::string>& partition_key) {
  std::scoped_lock lock(mutex_);
  try {
    EnsureCollectionLocked(collection);

    auto where = sql::BuildWhere(Dialect::Sqlite, query, partition_key, util::ToUnixMillis(clock_()));

    Statement s;
    s.st = db_->Prepare("SELECT COUNT(1) FROM " + sql::TableName(collection) + " WHERE " + where.sql + ";");
    BindParams(s.st, where.params);

    int rc = sqlite3_step(s.st);
    if (rc != SQLITE_ROW) ThrowRead(Translate(db_->Handle(), rc), "sqlite count");

    const int64_t count = sqlite3_column_int64(s.st, 0);
    return query.limit ? std::min(count, *query.limit) : count;
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    ThrowRead(FromException(e), "sqlite count");
  }
}

std::size_t SqliteDocumentStore::PurgeExpired() {
  std::scoped_lock lock(mutex_);
  try {
    std::vector<std::string> tables;
    {
      Statement s;
      s.st = db_->Prepare("SELECT name FROM sqlite_master WHERE type='table' AND name LIKE 'docs\\_%' ESCAPE '\\';");
      while (sqlite3_step(s.st) == SQLITE_ROW) {
        tables.push_back(ColText(s.st, 0));
      }
    }

    const auto  now_ms  = util::ToUnixMillis(clock_());
    std::size_t removed = 0;
    for (const auto& table : tables) {
      Statement s;
      s.st = db_->Prepare("DELETE FROM \"" + table + "\" WHERE expire_at_ms IS NOT NULL AND expire_at_ms <= ?;");
      BindI64(s.st, 1, now_ms);

      int rc = sqlite3_step(s.st);
      if (rc != SQLITE_DONE) ThrowRead(Translate(db_->Handle(), rc), "sqlite purge");
      removed += static_cast<std::size_t>(db_->Changes());
    }
    return removed;
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    ThrowRead(FromException(e), "sqlite purge");
  }
}

} // namespace jobstore::db::sqlite
