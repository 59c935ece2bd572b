#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/document_store.hpp"

namespace jobstore::db {

/*
  Lazy, restartable sequence over DocumentStore::Query.

  Pages are fetched on demand; Continuation() can be persisted and passed
  to a new cursor to resume after the last page that was fully consumed.
*/
class DocumentCursor {
 public:
  DocumentCursor(DocumentStore& store, std::string collection, DocumentQuery query, QueryOptions options);

  // nullopt when exhausted
  std::optional<Document> Next();

  // Drains the remaining documents.
  std::vector<Document> ToVector();

  const std::string& Continuation() const {
    return options_.continuation;
  }

 private:
  void FetchPage();

  DocumentStore&        store_;
  std::string           collection_;
  DocumentQuery         query_;
  QueryOptions          options_;
  std::vector<Document> page_;
  std::size_t           position_  = 0;
  bool                  exhausted_ = false;
};

} // namespace jobstore::db
