#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/api/document.hpp"
#include "internal/db/api/query.hpp"
#include "internal/db/api/result.hpp"

namespace jobstore::db {

/*
  DocumentStore

  Uniform access to named, partitioned collections.

  Contract shared by ALL backends:

  - Uniqueness on (collection, partition key, id); Create fails with
    AlreadyExists while a live document holds the key.
  - Expired documents (expire_at_ms <= now) are invisible to reads and
    queries and never block Create.
  - Every successful write assigns a fresh etag and timestamp, written
    back into the caller's Document.
  - Writes report failure through Result; reads throw util::StoreError.
  - Collections are created lazily on first use.
*/
class DocumentStore {
 public:
  virtual ~DocumentStore() = default;

  virtual std::optional<Document> Get(const std::string& collection, const std::string& id, const std::string& partition_key) = 0;

  virtual Result Create(const std::string& collection, Document& doc) = 0;

  virtual Result Upsert(const std::string& collection, Document& doc) = 0;

  // NotFound if the document vanished; Conflict if if_match is set and differs.
  virtual Result Replace(const std::string& collection, Document& doc, const std::optional<std::string>& if_match = std::nullopt) = 0;

  // Succeeds when the document is already absent.
  virtual Result Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                        const std::optional<std::string>& if_match = std::nullopt) = 0;

  virtual QueryPage Query(const std::string& collection, const DocumentQuery& query, const QueryOptions& options) = 0;

  virtual int64_t Count(const std::string& collection, const DocumentQuery& query, const std::optional<std::string>& partition_key) = 0;

  // Physically removes expired documents across all known collections.
  virtual std::size_t PurgeExpired() = 0;
};

} // namespace jobstore::db
