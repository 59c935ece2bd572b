#include "collection_resolver.hpp"

#include <stdexcept>

namespace jobstore::db {

namespace {

[[noreturn]] void ThrowUnknownKind(DocumentKind kind) {
  throw std::invalid_argument("unknown document kind: " + std::to_string(static_cast<int>(kind)));
}

} // namespace

std::string_view DocumentTypeName(DocumentKind kind) {
  switch (kind) {
    case DocumentKind::Job:
      return "job";
    case DocumentKind::JobIndex:
      return "jobindex";
    case DocumentKind::Server:
      return "server";
    case DocumentKind::Lock:
      return "lock";
    case DocumentKind::Queue:
      return "queue";
    case DocumentKind::Set:
      return "set";
    case DocumentKind::Hash:
      return "hash";
    case DocumentKind::List:
      return "list";
    case DocumentKind::Counter:
      return "counter";
  }
  ThrowUnknownKind(kind);
}

CollectionResolver::CollectionResolver(CollectionLayout layout, CollectionNames names) : layout_(layout), names_(std::move(names)) {
}

Location CollectionResolver::Resolve(DocumentKind kind, std::string_view key) const {
  return {CollectionFor(kind), PartitionKeyFor(kind, key)};
}

std::string CollectionResolver::CollectionFor(DocumentKind kind) const {
  if (layout_ == CollectionLayout::Consolidated) {
    switch (kind) {
      case DocumentKind::Job:
      case DocumentKind::JobIndex:
        return names_.jobs;
      case DocumentKind::Server:
      case DocumentKind::Lock:
      case DocumentKind::Queue:
      case DocumentKind::Counter:
        return names_.metadata;
      case DocumentKind::Set:
      case DocumentKind::Hash:
      case DocumentKind::List:
        return names_.collections;
    }
    ThrowUnknownKind(kind);
  }

  switch (kind) {
    case DocumentKind::Job:
    case DocumentKind::JobIndex:
      return names_.jobs;
    case DocumentKind::Server:
      return names_.servers;
    case DocumentKind::Lock:
      return names_.locks;
    case DocumentKind::Queue:
      return names_.queues;
    case DocumentKind::Set:
      return names_.sets;
    case DocumentKind::Hash:
      return names_.hashes;
    case DocumentKind::List:
      return names_.lists;
    case DocumentKind::Counter:
      return names_.counters;
  }
  ThrowUnknownKind(kind);
}

std::string CollectionResolver::PartitionKeyFor(DocumentKind kind, std::string_view key) {
  switch (kind) {
    case DocumentKind::Job:
      return "job:" + std::string(key);
    case DocumentKind::JobIndex:
      return "job-index";
    case DocumentKind::Server:
      return "servers";
    case DocumentKind::Lock:
      return "locks";
    case DocumentKind::Queue:
      return "queues";
    case DocumentKind::Set:
      return "set:" + std::string(key);
    case DocumentKind::Hash:
      return "hash:" + std::string(key);
    case DocumentKind::List:
      return "list:" + std::string(key);
    case DocumentKind::Counter:
      return "counters";
  }
  ThrowUnknownKind(kind);
}

DocumentKind CollectionResolver::KindFromInt(int value) {
  if (value < static_cast<int>(DocumentKind::Job) || value > static_cast<int>(DocumentKind::Counter)) {
    throw std::invalid_argument("unknown document kind: " + std::to_string(value));
  }
  return static_cast<DocumentKind>(value);
}

} // namespace jobstore::db
