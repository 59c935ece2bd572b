#pragma once

#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "internal/db/api/document_store.hpp"
#include "internal/util/time.hpp"
#include "pg_pool.hpp"

namespace jobstore::db::postgres {

/*
  PostgreSQL-backed document store.

  Same table layout as SQLite with a jsonb body; predicates compare
  body->'field' against jsonb literals so numbers order numerically.
*/
class PgDocumentStore final : public db::DocumentStore {
 public:
  explicit PgDocumentStore(std::shared_ptr<PgPool> pool, util::ClockFn clock = util::Now);

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
  static Result Translate(const std::exception& e);

  void EnsureCollection(const std::string& collection);

  std::shared_ptr<PgPool> pool_;
  util::ClockFn           clock_;

  std::mutex            collections_mutex_;
  std::set<std::string> known_collections_;
};

} // namespace jobstore::db::postgres
