#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "internal/db/api/document_store.hpp"
#include "internal/util/time.hpp"
#include "sqlite_db.hpp"

namespace jobstore::db::sqlite {

/*
  SQLite-backed document store.

  One table per collection (see sql::CreateCollectionSql), bodies kept as
  JSON text and filtered with json_extract. Create relies on the primary
  key plus an "overwrite only if expired" upsert, so exclusivity holds
  across processes sharing the database file.
*/
class SqliteDocumentStore final : public db::DocumentStore {
 public:
  explicit SqliteDocumentStore(std::shared_ptr<SqliteDB> db, util::ClockFn clock = util::Now);

  std::optional<Document> Get(const std::string& collection, const std::string& id, const std::string& partition_key) override;

  Result Create(const std::string& collection, Document& doc) override;
  Result Upsert(const std::string& collection, Document& doc) override;
  Result Replace(const std::string& collection, Document& doc, const std::optional<std::string>& if_match) override;
  Result Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                const std::optional<std::string>& if_match) override;

  QueryPage Query(const std::string& collection, const DocumentQuery& query, const QueryOptions& options) override;
  int64_t   Count(const std::string& collection, const DocumentQuery& query, const std::optional<std::string>& partition_key) override;

  std::size_t PurgeExpired() override;

 private:
  static Result Translate(sqlite3* db, int rc);

  void EnsureCollectionLocked(const std::string& collection);
  bool ExistsLiveLocked(const std::string& table, const std::string& id, const std::string& partition_key, int64_t now_ms);
  Result WriteLocked(const std::string& sql, Document& doc, int64_t now_ms, int* changes);

  std::shared_ptr<SqliteDB> db_;
  util::ClockFn             clock_;

  std::mutex            mutex_;
  std::set<std::string> known_collections_;
};

} // namespace jobstore::db::sqlite
