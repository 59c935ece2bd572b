#include "memory_document_store.hpp"

#include <algorithm>

#include "internal/db/memory/struct_match.hpp"

namespace jobstore::db::memory {

MemoryDocumentStore::MemoryDocumentStore(util::ClockFn clock) : clock_(std::move(clock)) {
}

MemoryDocumentStore::Collection& MemoryDocumentStore::CollectionLocked(const std::string& name) {
  // lazily created, lives as long as the store
  return collections_[name];
}

void MemoryDocumentStore::Stamp(Document& doc, int64_t now_ms) {
  doc.etag         = "\"" + std::to_string(++next_etag_) + "\"";
  doc.timestamp_ms = now_ms;
}

std::optional<Document> MemoryDocumentStore::Get(const std::string& collection, const std::string& id, const std::string& partition_key) {
  std::scoped_lock lock(mutex_);
  auto&            coll = CollectionLocked(collection);

  auto it = coll.find({partition_key, id});
  if (it == coll.end() || it->second.IsExpired(util::ToUnixMillis(clock_()))) {
    return std::nullopt;
  }
  return it->second;
}

Result MemoryDocumentStore::Create(const std::string& collection, Document& doc) {
  std::scoped_lock lock(mutex_);
  auto&            coll   = CollectionLocked(collection);
  const auto       now_ms = util::ToUnixMillis(clock_());

  auto it = coll.find({doc.partition_key, doc.id});
  if (it != coll.end()) {
    if (!it->second.IsExpired(now_ms)) {
      return Result::Err(ErrorCode::AlreadyExists, collection + "/" + doc.partition_key + "/" + doc.id);
    }
    coll.erase(it);
  }

  Stamp(doc, now_ms);
  coll.emplace(Key{doc.partition_key, doc.id}, doc);
  return Result::Ok();
}

Result MemoryDocumentStore::Upsert(const std::string& collection, Document& doc) {
  std::scoped_lock lock(mutex_);
  auto&            coll = CollectionLocked(collection);

  Stamp(doc, util::ToUnixMillis(clock_()));
  coll[{doc.partition_key, doc.id}] = doc;
  return Result::Ok();
}

Result MemoryDocumentStore::Replace(const std::string& collection, Document& doc, const std::optional<std::string>& if_match) {
  std::scoped_lock lock(mutex_);
  auto&            coll   = CollectionLocked(collection);
  const auto       now_ms = util::ToUnixMillis(clock_());

  auto it = coll.find({doc.partition_key, doc.id});
  if (it == coll.end() || it->second.IsExpired(now_ms)) {
    return Result::Err(ErrorCode::NotFound, collection + "/" + doc.partition_key + "/" + doc.id);
  }
  if (if_match && it->second.etag != *if_match) {
    return Result::Err(ErrorCode::Conflict, "etag mismatch for " + doc.id);
  }

  Stamp(doc, now_ms);
  it->second = doc;
  return Result::Ok();
}

Result MemoryDocumentStore::Delete(const std::string& collection, const std::string& id, const std::string& partition_key,
                                   const std::optional<std::string>& if_match) {
  std::scoped_lock lock(mutex_);
  auto&            coll = CollectionLocked(collection);

  auto it = coll.find({partition_key, id});
  if (it == coll.end()) {
    return Result::Ok();
  }
  if (if_match && !it->second.IsExpired(util::ToUnixMillis(clock_())) && it->second.etag != *if_match) {
    return Result::Err(ErrorCode::Conflict, "etag mismatch for " + id);
  }
  coll.erase(it);
  return Result::Ok();
}

std::vector<const Document*> MemoryDocumentStore::MatchLocked(Collection& coll, const DocumentQuery& query,
                                                              const std::optional<std::string>& partition_key, int64_t now_ms) const {
  std::vector<const Document*> matches;
  for (const auto& [key, doc] : coll) {
    if (partition_key && key.first != *partition_key) continue;
    if (doc.IsExpired(now_ms)) continue;
    if (query.document_type && doc.document_type != *query.document_type) continue;
    if (!MatchesAll(doc.body, query.where)) continue;
    matches.push_back(&doc);
  }

  if (query.order_by) {
    const auto& order = *query.order_by;
    std::stable_sort(matches.begin(), matches.end(), [&](const Document* a, const Document* b) {
      const int cmp = CompareFields(a->body, b->body, order.field);
      return order.descending ? cmp > 0 : cmp < 0;
    });
  }
  return matches;
}

QueryPage MemoryDocumentStore::Query(const std::string& collection, const DocumentQuery& query, const QueryOptions& options) {
  std::scoped_lock lock(mutex_);
  auto&            coll    = CollectionLocked(collection);
  auto             matches = MatchLocked(coll, query, options.partition_key, util::ToUnixMillis(clock_()));

  int64_t total = static_cast<int64_t>(matches.size());
  if (query.limit && *query.limit < total) {
    total = *query.limit;
  }

  const int64_t offset    = DecodeContinuation(options.continuation);
  const int64_t page_size = options.page_size > 0 ? options.page_size : total;
  const int64_t end       = std::min(total, offset + page_size);

  QueryPage page;
  for (int64_t i = offset; i < end; ++i) {
    page.documents.push_back(*matches[static_cast<std::size_t>(i)]);
  }
  if (end < total) {
    page.continuation = EncodeContinuation(end);
  }
  return page;
}

int64_t MemoryDocumentStore::Count(const std::string& collection, const DocumentQuery& query, const std::optional<std::string>& partition_key) {
  std::scoped_lock lock(mutex_);
  auto&            coll = CollectionLocked(collection);

  DocumentQuery unordered = query;
  unordered.order_by.reset();
  auto count = static_cast<int64_t>(MatchLocked(coll, unordered, partition_key, util::ToUnixMillis(clock_())).size());
  return query.limit ? std::min(count, *query.limit) : count;
}

std::size_t MemoryDocumentStore::PurgeExpired() {
  std::scoped_lock lock(mutex_);
  const auto       now_ms = util::ToUnixMillis(clock_());

  std::size_t removed = 0;
  for (auto& [name, coll] : collections_) {
    for (auto it = coll.begin(); it != coll.end();) {
      if (it->second.IsExpired(now_ms)) {
        it = coll.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  return removed;
}

} // namespace jobstore::db::memory
