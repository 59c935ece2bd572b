#include "cursor.hpp"

namespace jobstore::db {

DocumentCursor::DocumentCursor(DocumentStore& store, std::string collection, DocumentQuery query, QueryOptions options)
    : store_(store), collection_(std::move(collection)), query_(std::move(query)), options_(std::move(options)) {
}

void DocumentCursor::FetchPage() {
  auto page = store_.Query(collection_, query_, options_);
  page_     = std::move(page.documents);
  position_ = 0;

  options_.continuation = page.continuation;
  if (page.continuation.empty()) {
    exhausted_ = true;
  }
}

std::optional<Document> DocumentCursor::Next() {
  while (position_ >= page_.size()) {
    if (exhausted_) {
      return std::nullopt;
    }
    FetchPage();
  }
  return std::move(page_[position_++]);
}

std::vector<Document> DocumentCursor::ToVector() {
  std::vector<Document> out;
  while (auto doc = Next()) {
    out.push_back(std::move(*doc));
  }
  return out;
}

} // namespace jobstore::db
