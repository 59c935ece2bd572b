#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/connection/storage_connection.hpp"
#include "internal/db/api/cursor.hpp"
#include "internal/db/api/document_store.hpp"
#include "internal/db/memory/memory_document_store.hpp"
#include "internal/monitoring/monitoring_api.hpp"
#include "internal/util/errors.hpp"

#if JOBSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_document_store.hpp"
#endif

#if JOBSTORE_DB_POSTGRES
#include "internal/db/postgres/pg_document_store.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace {

using jobstore::db::CompareOp;
using jobstore::db::Document;
using jobstore::db::DocumentQuery;
using jobstore::db::DocumentStore;
using jobstore::db::ErrorCode;
using jobstore::db::QueryOptions;
namespace states = jobstore::jobs::states;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                     name;
  std::function<std::shared_ptr<DocumentStore>()> make_store;
  std::function<bool()>                           supports_restart;
  std::function<void()>                           cleanup;
};

Document MakeDoc(const std::string& id, const std::string& partition, double score, const std::string& label) {
  Document doc;
  doc.id            = id;
  doc.partition_key = partition;
  doc.document_type = "set";

  auto& fields = *doc.body.mutable_fields();
  fields["key"].set_string_value(partition);
  fields["score"].set_number_value(score);
  fields["label"].set_string_value(label);
  fields["active"].set_bool_value(score >= 5);
  return doc;
}

std::vector<std::string> IdsOf(const std::vector<Document>& docs) {
  std::vector<std::string> ids;
  for (const auto& doc : docs) {
    ids.push_back(doc.id);
  }
  return ids;
}

void VerifyCreateReplaceDelete(DocumentStore& store, const std::string& collection) {
  auto doc    = MakeDoc("crud-1", "p", 1, "first");
  auto create = store.Create(collection, doc);
  assert(create);
  assert(!doc.etag.empty());
  assert(doc.timestamp_ms > 0);

  auto duplicate = MakeDoc("crud-1", "p", 2, "second");
  assert(store.Create(collection, duplicate).code == ErrorCode::AlreadyExists);

  // same id in another partition is a different document
  auto other_partition = MakeDoc("crud-1", "q", 2, "other");
  assert(store.Create(collection, other_partition));

  auto loaded = store.Get(collection, "crud-1", "p");
  assert(loaded.has_value());
  assert(loaded->etag == doc.etag);
  assert(loaded->body.fields().at("label").string_value() == "first");

  const auto first_etag = loaded->etag;
  (*loaded->body.mutable_fields())["label"].set_string_value("updated");
  assert(store.Replace(collection, *loaded, first_etag));
  assert(loaded->etag != first_etag);

  auto stale = *loaded;
  assert(store.Replace(collection, stale, first_etag).code == ErrorCode::Conflict);
  assert(store.Delete(collection, "crud-1", "p", first_etag).code == ErrorCode::Conflict);

  auto missing = MakeDoc("crud-missing", "p", 1, "x");
  assert(store.Replace(collection, missing, std::nullopt).code == ErrorCode::NotFound);

  assert(store.Delete(collection, "crud-1", "p", loaded->etag));
  assert(!store.Get(collection, "crud-1", "p").has_value());
  assert(store.Get(collection, "crud-1", "q").has_value());

  // upsert creates then overwrites unconditionally
  auto upserted = MakeDoc("crud-2", "p", 3, "a");
  assert(store.Upsert(collection, upserted));
  auto again = MakeDoc("crud-2", "p", 4, "b");
  assert(store.Upsert(collection, again));
  assert(store.Get(collection, "crud-2", "p")->body.fields().at("label").string_value() == "b");
}

void VerifyQueryOrderingAndPaging(DocumentStore& store, const std::string& collection) {
  const double scores[] = {10, 2, 33, 4, 5};
  for (int i = 0; i < 5; ++i) {
    auto doc = MakeDoc("q-" + std::to_string(i), "scores", scores[i], "item");
    assert(store.Create(collection, doc));
  }
  auto foreign = MakeDoc("q-foreign", "elsewhere", 7, "item");
  assert(store.Create(collection, foreign));

  QueryOptions options;
  options.partition_key = "scores";

  // numbers order numerically, not as text
  DocumentQuery ordered;
  ordered.OfType("set").Where("score", CompareOp::Ge, 4.0).OrderedBy("score");
  auto page = store.Query(collection, ordered, options);
  assert((IdsOf(page.documents) == std::vector<std::string>{"q-3", "q-4", "q-0", "q-2"}));

  DocumentQuery descending;
  descending.OfType("set").OrderedBy("score", true).Limit(2);
  page = store.Query(collection, descending, options);
  assert((IdsOf(page.documents) == std::vector<std::string>{"q-2", "q-0"}));

  DocumentQuery active;
  active.OfType("set").Where("active", true);
  assert(store.Count(collection, active, std::string("scores")) == 3);
  assert(store.Count(collection, active, std::nullopt) == 4);

  DocumentQuery by_label;
  by_label.OfType("set").Where("label", std::string("item")).Where("score", CompareOp::Ne, 2.0);
  assert(store.Count(collection, by_label, std::string("scores")) == 4);

  DocumentQuery wrong_type;
  wrong_type.OfType("hash");
  assert(store.Count(collection, wrong_type, std::string("scores")) == 0);

  // two-at-a-time paging visits every document once
  DocumentQuery all;
  all.OfType("set").OrderedBy("score");
  QueryOptions paged = options;
  paged.page_size    = 2;
  auto everything    = jobstore::db::DocumentCursor(store, collection, all, paged).ToVector();
  assert((IdsOf(everything) == std::vector<std::string>{"q-1", "q-3", "q-4", "q-0", "q-2"}));

  paged.continuation = jobstore::db::EncodeContinuation(4);
  page               = store.Query(collection, all, paged);
  assert((IdsOf(page.documents) == std::vector<std::string>{"q-2"}));
  assert(page.continuation.empty());
}

void VerifyExpiry(DocumentStore& store, const std::string& collection) {
  auto expired         = MakeDoc("exp-1", "ttl", 1, "gone");
  expired.expire_at_ms = NowMs() - 1000;
  assert(store.Upsert(collection, expired));

  auto live         = MakeDoc("exp-2", "ttl", 2, "here");
  live.expire_at_ms = NowMs() + 60'000;
  assert(store.Upsert(collection, live));

  assert(!store.Get(collection, "exp-1", "ttl").has_value());
  assert(store.Get(collection, "exp-2", "ttl")->expire_at_ms == live.expire_at_ms);

  DocumentQuery query;
  query.OfType("set");
  assert(store.Count(collection, query, std::string("ttl")) == 1);

  // an expired document does not block creation
  auto replacement = MakeDoc("exp-1", "ttl", 3, "reborn");
  assert(store.Create(collection, replacement));
  assert(store.Get(collection, "exp-1", "ttl")->body.fields().at("label").string_value() == "reborn");

  auto purge_me         = MakeDoc("exp-3", "ttl", 4, "purge");
  purge_me.expire_at_ms = NowMs() - 1;
  assert(store.Upsert(collection, purge_me));
  assert(store.PurgeExpired() >= 1);
  assert(store.Count(collection, query, std::string("ttl")) == 2);
}

jobstore::config::StorageOptions OptionsFor(const std::string& suffix) {
  jobstore::config::StorageOptions options;
  options.collections.jobs     = "jobs_" + suffix;
  options.collections.servers  = "servers_" + suffix;
  options.collections.locks    = "locks_" + suffix;
  options.collections.queues   = "queues_" + suffix;
  options.collections.sets     = "sets_" + suffix;
  options.collections.hashes   = "hashes_" + suffix;
  options.collections.lists    = "lists_" + suffix;
  options.collections.counters = "counters_" + suffix;
  options.retry.delay          = std::chrono::milliseconds(5);
  return options;
}

void VerifyJobLifecycleAcrossServers(const std::shared_ptr<DocumentStore>& store, const std::string& suffix) {
  const auto options = OptionsFor(suffix);
  jobstore::connection::StorageConnection server_a(store, options, "server-a");
  jobstore::connection::StorageConnection server_b(store, options, "server-b");

  jobstore::jobs::Invocation invocation;
  invocation.type            = "Reports";
  invocation.method          = "Render";
  invocation.parameter_types = {"System.Int32"};
  invocation.arguments       = {"42"};

  std::vector<std::string> ids;
  for (int i = 0; i < 4; ++i) {
    const auto id    = server_a.CreateExpiredJob(invocation, "reports", {{"Attempt", "0"}}, std::chrono::hours(1));
    auto       batch = server_a.CreateWriteBatch();
    batch->AddToQueue("reports", id);
    batch->Commit();
    ids.push_back(id);
  }

  // both servers drain the queue; every job is claimed once
  std::vector<std::string> claimed;
  for (int i = 0; i < 4; ++i) {
    auto& connection = (i % 2 == 0) ? server_a : server_b;
    auto  fetched    = connection.FetchNextJob({"reports"}, jobstore::util::CancellationToken::None());
    assert(fetched);
    fetched->Acknowledge();
    claimed.push_back(fetched->JobId());

    auto batch = connection.CreateWriteBatch();
    batch->SetJobState(fetched->JobId(), {std::string(states::kSucceeded), "Completed", {}});
    batch->ExpireJob(fetched->JobId(), options.job_ttl);
    jobstore::monitoring::AddOutcomeCounters(*batch, states::kSucceeded, jobstore::util::Now(), options.counter_ttl);
    batch->Commit();
  }
  std::sort(claimed.begin(), claimed.end());
  std::sort(ids.begin(), ids.end());
  assert(claimed == ids);

  jobstore::monitoring::MonitoringApi monitoring(server_b);
  const auto                          stats = monitoring.GetStatistics();
  assert(stats.succeeded == 4);
  assert(stats.enqueued == 0);
  assert(stats.processing == 0);
  assert(server_b.GetCounter("stats:succeeded") == 4);

  // job data survives the round trip through the backend
  const auto data = server_b.GetJobData(ids.front());
  assert(data && data->invocation == invocation);
  assert(server_b.GetJobParameter(ids.front(), "Attempt") == std::optional<std::string>("0"));

  // locks exclude across servers
  auto held = server_a.AcquireDistributedLock("parity-lock", std::chrono::seconds(10));
  bool blocked = false;
  try {
    auto lock = server_b.AcquireDistributedLock("parity-lock", std::chrono::seconds(10));
  } catch (const jobstore::util::LockUnavailable&) {
    blocked = true;
  }
  assert(blocked);
  held->Release();
  auto after = server_b.AcquireDistributedLock("parity-lock", std::chrono::seconds(10));
  assert(after->IsHeld());

  server_a.AnnounceServer("server-a", {1, {"reports"}});
  server_b.AnnounceServer("server-b", {1, {"reports"}});
  assert(monitoring.Servers().size() == 2);
  server_a.RemoveServer("server-a");
  server_b.RemoveServer("server-b");
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& collection) {
  if (!backend.supports_restart()) {
    return;
  }

  {
    auto store = backend.make_store();
    auto doc   = MakeDoc("durable-1", "d", 9, "kept");
    assert(store->Upsert(collection, doc));
  }

  auto reopened = backend.make_store();
  auto loaded   = reopened->Get(collection, "durable-1", "d");
  assert(loaded.has_value());
  assert(loaded->body.fields().at("score").number_value() == 9);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_store       = []() { return std::make_shared<jobstore::db::memory::MemoryDocumentStore>(); },
      .supports_restart = []() { return false; },
      .cleanup          = []() {},
  };
}

#if JOBSTORE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("jobstore_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  return BackendFactory{
      .name = "sqlite",
      .make_store =
          [db_path]() {
            auto db = std::make_shared<jobstore::db::sqlite::SqliteDB>(db_path);
            return std::make_shared<jobstore::db::sqlite::SqliteDocumentStore>(std::move(db));
          },
      .supports_restart = []() { return true; },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if JOBSTORE_DB_SQLITE
// A query the SQL builder rejects is bad data, not a sick store.
void VerifySqliteRejectedQueryIsNotTransient() {
  auto db_path = (std::filesystem::temp_directory_path() / ("jobstore_integration_badquery_" + std::to_string(NowMs()) + ".db")).string();
  {
    jobstore::db::sqlite::SqliteDocumentStore store(std::make_shared<jobstore::db::sqlite::SqliteDB>(db_path));

    DocumentQuery query;
    query.OfType("set").Where("not a field", std::string("x"));

    bool threw = false;
    try {
      (void)store.Query("rejected", query, QueryOptions{});
    } catch (const jobstore::util::StoreError& e) {
      threw = true;
      assert(e.code() == ErrorCode::InvalidData);
      assert(!jobstore::db::IsTransient(e.code()));
    }
    assert(threw);
  }
  std::filesystem::remove(db_path);
}
#endif

#if JOBSTORE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("JOBSTORE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("JOBSTORE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  return BackendFactory{
      .name = "postgres",
      .make_store =
          [conninfo]() {
            auto pool = std::make_shared<jobstore::db::postgres::PgPool>(conninfo);
            return std::make_shared<jobstore::db::postgres::PgDocumentStore>(std::move(pool));
          },
      .supports_restart = []() { return true; },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto store = backend.make_store();

  // unique names so reruns against a persistent server start clean
  const auto suffix     = std::to_string(NowMs());
  const auto collection = "parity_" + suffix;

  VerifyCreateReplaceDelete(*store, collection);
  VerifyQueryOrderingAndPaging(*store, collection);
  VerifyExpiry(*store, collection + "_ttl");
  VerifyJobLifecycleAcrossServers(store, suffix);
  VerifyRestartDurability(backend, collection + "_durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if JOBSTORE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
  VerifySqliteRejectedQueryIsNotTransient();
#endif

#if JOBSTORE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "jobstore_integration_document_store_parity: pass\n";
  return 0;
}
