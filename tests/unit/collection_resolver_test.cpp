#include "internal/db/collection_resolver.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using jobstore::db::CollectionLayout;
using jobstore::db::CollectionNames;
using jobstore::db::CollectionResolver;
using jobstore::db::DocumentKind;

void TestDedicatedLayoutUsesOneCollectionPerKind() {
  CollectionResolver resolver(CollectionLayout::Dedicated, CollectionNames{});

  assert(resolver.CollectionFor(DocumentKind::Job) == "jobs");
  assert(resolver.CollectionFor(DocumentKind::JobIndex) == "jobs");
  assert(resolver.CollectionFor(DocumentKind::Server) == "servers");
  assert(resolver.CollectionFor(DocumentKind::Lock) == "locks");
  assert(resolver.CollectionFor(DocumentKind::Queue) == "queues");
  assert(resolver.CollectionFor(DocumentKind::Set) == "sets");
  assert(resolver.CollectionFor(DocumentKind::Hash) == "hashes");
  assert(resolver.CollectionFor(DocumentKind::List) == "lists");
  assert(resolver.CollectionFor(DocumentKind::Counter) == "counters");
}

void TestConsolidatedLayoutGroupsKinds() {
  CollectionNames names;
  names.metadata    = "meta";
  names.collections = "colls";
  CollectionResolver resolver(CollectionLayout::Consolidated, names);

  assert(resolver.CollectionFor(DocumentKind::Job) == "jobs");
  assert(resolver.CollectionFor(DocumentKind::Server) == "meta");
  assert(resolver.CollectionFor(DocumentKind::Lock) == "meta");
  assert(resolver.CollectionFor(DocumentKind::Queue) == "meta");
  assert(resolver.CollectionFor(DocumentKind::Counter) == "meta");
  assert(resolver.CollectionFor(DocumentKind::Set) == "colls");
  assert(resolver.CollectionFor(DocumentKind::Hash) == "colls");
  assert(resolver.CollectionFor(DocumentKind::List) == "colls");
}

void TestPartitionKeysDoNotDependOnLayout() {
  CollectionResolver dedicated(CollectionLayout::Dedicated, CollectionNames{});
  CollectionResolver consolidated(CollectionLayout::Consolidated, CollectionNames{});

  for (auto kind : {DocumentKind::Job, DocumentKind::Server, DocumentKind::Set, DocumentKind::List, DocumentKind::Counter}) {
    assert(dedicated.Resolve(kind, "critical").partition_key == consolidated.Resolve(kind, "critical").partition_key);
  }

  assert(CollectionResolver::PartitionKeyFor(DocumentKind::Job, "critical") == "job:critical");
  assert(CollectionResolver::PartitionKeyFor(DocumentKind::JobIndex) == "job-index");
  assert(CollectionResolver::PartitionKeyFor(DocumentKind::Server, "ignored") == "servers");
  assert(CollectionResolver::PartitionKeyFor(DocumentKind::Lock) == "locks");
  assert(CollectionResolver::PartitionKeyFor(DocumentKind::Queue) == "queues");
  assert(CollectionResolver::PartitionKeyFor(DocumentKind::Set, "recurring-jobs") == "set:recurring-jobs");
  assert(CollectionResolver::PartitionKeyFor(DocumentKind::Hash, "recurring-job:a") == "hash:recurring-job:a");
  assert(CollectionResolver::PartitionKeyFor(DocumentKind::List, "history") == "list:history");
  assert(CollectionResolver::PartitionKeyFor(DocumentKind::Counter, "stats:succeeded") == "counters");
}

void TestDocumentTypeNames() {
  assert(jobstore::db::DocumentTypeName(DocumentKind::Job) == "job");
  assert(jobstore::db::DocumentTypeName(DocumentKind::Server) == "server");
  assert(jobstore::db::DocumentTypeName(DocumentKind::Counter) == "counter");
}

void TestKindFromIntRejectsOutOfRange() {
  assert(CollectionResolver::KindFromInt(0) == DocumentKind::Job);
  assert(CollectionResolver::KindFromInt(static_cast<int>(DocumentKind::Counter)) == DocumentKind::Counter);

  bool threw = false;
  try {
    (void)CollectionResolver::KindFromInt(42);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)CollectionResolver::KindFromInt(-1);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDedicatedLayoutUsesOneCollectionPerKind();
  TestConsolidatedLayoutGroupsKinds();
  TestPartitionKeysDoNotDependOnLayout();
  TestDocumentTypeNames();
  TestKindFromIntRejectsOutOfRange();

  std::cout << "jobstore_unit_collection_resolver: pass\n";
  return 0;
}
