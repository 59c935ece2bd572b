#pragma once

#include <string>
#include <string_view>

namespace jobstore::db {

enum class DocumentKind {
  Job,
  JobIndex,
  Server,
  Lock,
  Queue,
  Set,
  Hash,
  List,
  Counter,
};

enum class CollectionLayout {
  Dedicated,    // one collection per kind
  Consolidated, // jobs / metadata / collections
};

struct CollectionNames {
  std::string jobs     = "jobs";
  std::string servers  = "servers";
  std::string locks    = "locks";
  std::string queues   = "queues";
  std::string sets     = "sets";
  std::string hashes   = "hashes";
  std::string lists    = "lists";
  std::string counters = "counters";

  // consolidated layout only
  std::string metadata    = "metadata";
  std::string collections = "collections";
};

struct Location {
  std::string collection;
  std::string partition_key;
};

// "job", "server", ... as stored in documentType
std::string_view DocumentTypeName(DocumentKind kind);

/*
  CollectionResolver

  Pure mapping: (kind, key) -> (physical collection, partition key).

  The key is the part of the partition key that depends on the document:
  the queue name for jobs, the set/hash/list key for collections; it is
  ignored for kinds that share one partition.

  Partition keys do not depend on the layout, so a document keeps its
  partition when the layout changes and same-key documents stay colocated
  in the consolidated collections.
*/
class CollectionResolver {
 public:
  CollectionResolver(CollectionLayout layout, CollectionNames names);

  Location Resolve(DocumentKind kind, std::string_view key = {}) const;

  std::string CollectionFor(DocumentKind kind) const;

  static std::string PartitionKeyFor(DocumentKind kind, std::string_view key = {});

  // Integer-typed entry point for callers holding a raw discriminator.
  // Throws std::invalid_argument for values outside DocumentKind.
  static DocumentKind KindFromInt(int value);

  CollectionLayout Layout() const {
    return layout_;
  }

  const CollectionNames& Names() const {
    return names_;
  }

 private:
  CollectionLayout layout_;
  CollectionNames  names_;
};

} // namespace jobstore::db
