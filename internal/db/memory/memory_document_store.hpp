#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/db/api/document_store.hpp"
#include "internal/util/time.hpp"

namespace jobstore::db::memory {

/*
  In-process document store.

  Used by tests and the `database.memory` backend. One mutex guards all
  collections; every operation is atomic with respect to the others, which
  is stronger than what the contract requires.
*/
class MemoryDocumentStore final : public db::DocumentStore {
 public:
  explicit MemoryDocumentStore(util::ClockFn clock = util::Now);

  std::optional<Document> Get(const std::string& collection, const std::string& id, const std::string& partition_key) override;

  Result Create(const std::string& collection, Document& doc) override;
  Result Upsert(const std::string& collection, Document& doc) override;
  Result Replace(const std::string& collection, Document& doc, const std::optional<std::string>& if_match = std::nullopt) override;
  Result Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                const std::optional<std::string>& if_match = std::nullopt) override;

  QueryPage Query(const std::string& collection, const DocumentQuery& query, const QueryOptions& options) override;
  int64_t   Count(const std::string& collection, const DocumentQuery& query, const std::optional<std::string>& partition_key) override;

  std::size_t PurgeExpired() override;

 private:
  using Key        = std::pair<std::string, std::string>; // (partition key, id)
  using Collection = std::map<Key, Document>;

  Collection& CollectionLocked(const std::string& name);
  void        Stamp(Document& doc, int64_t now_ms);

  std::vector<const Document*> MatchLocked(Collection& coll, const DocumentQuery& query, const std::optional<std::string>& partition_key,
                                           int64_t now_ms) const;

  util::ClockFn clock_;

  std::mutex                                  mutex_;
  std::unordered_map<std::string, Collection> collections_;
  uint64_t                                    next_etag_ = 0;
};

} // namespace jobstore::db::memory
