#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdio>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/jobs/invocation.hpp"
#include "internal/jobs/job_state.hpp"
#include "internal/jobs/stale_job_reaper.hpp"
#include "internal/monitoring/monitoring_api.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

using jobstore::observability::IntField;
using jobstore::observability::StringField;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

constexpr const char* kServerCleanupLock = "jobstore:server-cleanup";
constexpr const char* kExpirationLock    = "jobstore:expiration-manager";

// Interruptible sleep shared by every background thread.
class Stopper {
 public:
  // false once Stop() was called
  bool WaitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return stopped_; });
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopped_ = false;
};

struct WorkerSettings {
  std::string               server_id;
  uint32_t                  worker_count = 1;
  std::vector<std::string>  queues;
  std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds housekeeping_interval{std::chrono::minutes(1)};
  std::chrono::milliseconds stale_job_timeout{0};
};

std::string DefaultServerId() {
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) != 0) {
    std::snprintf(host, sizeof(host), "worker");
  }
  return std::string(host) + ":" + std::to_string(getpid()) + ":" + jobstore::util::ToCompactString(jobstore::util::GenerateUUID()).substr(0, 8);
}

WorkerSettings ReadWorkerSettings(const jobstore::runtime::config::WorkerConfig& worker) {
  WorkerSettings settings;
  settings.server_id    = worker.server_id().empty() ? DefaultServerId() : worker.server_id();
  settings.worker_count = worker.worker_count() > 0 ? worker.worker_count() : std::max(1u, std::thread::hardware_concurrency());
  settings.queues.assign(worker.queues().begin(), worker.queues().end());
  if (settings.queues.empty()) {
    settings.queues.push_back("default");
  }
  if (worker.poll_interval_ms() > 0) {
    settings.poll_interval = std::chrono::milliseconds(worker.poll_interval_ms());
  }
  if (worker.heartbeat_interval_ms() > 0) {
    settings.heartbeat_interval = std::chrono::milliseconds(worker.heartbeat_interval_ms());
  }
  if (worker.housekeeping_interval_ms() > 0) {
    settings.housekeeping_interval = std::chrono::milliseconds(worker.housekeeping_interval_ms());
  }
  settings.stale_job_timeout = std::chrono::milliseconds(worker.stale_job_timeout_ms());
  return settings;
}

// Handlers compiled into the stock worker. Embedders register their own.
void RegisterBuiltinHandlers(jobstore::jobs::InvocationRegistry& registry) {
  registry.Register("Jobstore.Builtin", "Echo", {"string"}, [](const jobstore::jobs::JobContext& ctx) {
    JOBSTORE_LOG_INFO("echo", {StringField("job_id", ctx.job_id), StringField("message", ctx.invocation.arguments.at(0))});
  });

  registry.Register("Jobstore.Builtin", "Sleep", {"int"}, [](const jobstore::jobs::JobContext& ctx) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::stoll(ctx.invocation.arguments.at(0)));
    while (std::chrono::steady_clock::now() < deadline) {
      ctx.cancellation.ThrowIfCancelled("sleep job " + ctx.job_id);
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  registry.Register("Jobstore.Builtin", "Fail", {"string"}, [](const jobstore::jobs::JobContext& ctx) {
    throw std::runtime_error(ctx.invocation.arguments.at(0));
  });
}

void FinishJob(jobstore::connection::StorageConnection& connection, const std::string& job_id, jobstore::jobs::StateChange state) {
  const auto& options = connection.Options();
  const auto  outcome = state.name;

  auto batch = connection.CreateWriteBatch();
  batch->SetJobState(job_id, std::move(state));
  batch->ExpireJob(job_id, options.job_ttl);
  jobstore::monitoring::AddOutcomeCounters(*batch, outcome, connection.Jobs().Now(), options.counter_ttl);
  batch->Commit();
}

void ProcessOne(jobstore::connection::StorageConnection& connection, const jobstore::jobs::InvocationRegistry& registry,
                jobstore::queue::FetchedJob& fetched, const jobstore::util::CancellationToken& cancellation) {
  namespace states = jobstore::jobs::states;

  fetched.Acknowledge();

  const auto& body       = fetched.Record().body;
  const auto  invocation = jobstore::jobs::FromProto(body.invocation_data());

  std::map<std::string, std::string> parameters(body.parameters().begin(), body.parameters().end());
  const jobstore::jobs::JobContext   context{fetched.JobId(), fetched.Queue(), invocation, std::move(parameters), cancellation};

  jobstore::observability::SpanScope span("jobstore.job.perform");
  span.SetAttribute("job.id", fetched.JobId());
  span.SetAttribute("job.queue", fetched.Queue());

  const auto started = std::chrono::steady_clock::now();
  try {
    registry.Invoke(context);
  } catch (const jobstore::util::InvocationError& e) {
    // nothing can run it; leave it in processing for an operator to look at
    span.RecordException(e.what());
    JOBSTORE_LOG_ERROR("job invocation cannot be resolved",
                       {StringField("job_id", fetched.JobId()), StringField("signature", jobstore::jobs::Signature(invocation)),
                        StringField("error", e.what())});
    return;
  } catch (const jobstore::util::OperationCancelled&) {
    JOBSTORE_LOG_WARN("job interrupted by shutdown, requeueing", {StringField("job_id", fetched.JobId())});
    auto batch = connection.CreateWriteBatch();
    batch->AddToQueue(fetched.Queue(), fetched.JobId());
    batch->Commit();
    return;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    JOBSTORE_LOG_WARN("job failed", {StringField("job_id", fetched.JobId()), StringField("error", e.what())});
    FinishJob(connection, fetched.JobId(),
              {std::string(states::kFailed), "An exception occurred during performance of the job", {{"ExceptionMessage", e.what()}}});
    return;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  FinishJob(connection, fetched.JobId(),
            {std::string(states::kSucceeded), "Completed", {{"PerformanceDuration", std::to_string(elapsed)}}});
}

void WorkerLoop(jobstore::connection::StorageConnection& connection, const jobstore::jobs::InvocationRegistry& registry,
                const WorkerSettings& settings, const jobstore::util::CancellationToken& cancellation, Stopper& stopper) {
  while (!cancellation.IsCancelled()) {
    try {
      auto fetched = connection.FetchNextJob(settings.queues, cancellation);
      if (!fetched) {
        if (!stopper.WaitFor(settings.poll_interval)) break;
        continue;
      }
      ProcessOne(connection, registry, *fetched, cancellation);
    } catch (const jobstore::util::OperationCancelled&) {
      break;
    } catch (const jobstore::util::CircuitOpen& e) {
      const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(e.retry_after() - std::chrono::system_clock::now());
      JOBSTORE_LOG_WARN("store circuit open, pausing fetch", {StringField("operation", e.operation())});
      if (!stopper.WaitFor(std::max(wait, settings.poll_interval))) break;
    } catch (const std::exception& e) {
      JOBSTORE_LOG_ERROR("worker iteration failed", {StringField("error", e.what())});
      if (!stopper.WaitFor(settings.poll_interval)) break;
    }
  }
}

void HeartbeatLoop(jobstore::connection::StorageConnection& connection, const WorkerSettings& settings,
                   const jobstore::connection::ServerContext& context, Stopper& stopper) {
  while (stopper.WaitFor(settings.heartbeat_interval)) {
    try {
      connection.Heartbeat(settings.server_id);
    } catch (const jobstore::util::NotFound&) {
      JOBSTORE_LOG_WARN("server document vanished, announcing again", {StringField("server_id", settings.server_id)});
      try {
        connection.AnnounceServer(settings.server_id, context);
      } catch (const std::exception& e) {
        JOBSTORE_LOG_ERROR("re-announce failed", {StringField("error", e.what())});
      }
    } catch (const std::exception& e) {
      JOBSTORE_LOG_ERROR("heartbeat failed", {StringField("server_id", settings.server_id), StringField("error", e.what())});
    }
  }
}

void HousekeepingPass(jobstore::connection::StorageConnection& connection, const WorkerSettings& settings) {
  const auto& options = connection.Options();

  try {
    auto lock = connection.AcquireDistributedLock(kServerCleanupLock, options.lock_timeout);
    connection.RemoveTimedOutServers(options.server_timeout);
  } catch (const jobstore::util::LockUnavailable&) {
    // another server is on it
  }

  try {
    auto       lock   = connection.AcquireDistributedLock(kExpirationLock, options.lock_timeout);
    const auto purged = connection.Store().PurgeExpired();
    if (purged > 0) {
      JOBSTORE_LOG_INFO("purged expired documents", {IntField("count", static_cast<int64_t>(purged))});
    }
  } catch (const jobstore::util::LockUnavailable&) {
  }

  if (settings.stale_job_timeout.count() > 0) {
    jobstore::jobs::StaleJobReaper reaper(connection.Jobs(), connection.Locks(), options.lock_timeout);
    reaper.RequeueStaleJobs(settings.stale_job_timeout);
  }
}

void HousekeepingLoop(jobstore::connection::StorageConnection& connection, const WorkerSettings& settings, Stopper& stopper) {
  while (stopper.WaitFor(settings.housekeeping_interval)) {
    try {
      HousekeepingPass(connection, settings);
    } catch (const std::exception& e) {
      JOBSTORE_LOG_ERROR("housekeeping failed", {StringField("error", e.what())});
    }
  }
}

void ShutdownObservability() {
  jobstore::observability::ShutdownLogging();
  jobstore::observability::ShutdownMetrics();
  jobstore::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: jobstore-worker <config.yaml> OR jobstore-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = jobstore::config::ConfigLoader::LoadFromYaml(config_path);

    jobstore::observability::InitializeTracing(config);
    jobstore::observability::InitializeMetrics(config);
    jobstore::observability::InitializeLogging(config);

    const auto settings = ReadWorkerSettings(config.worker());

    // ------------------------------------------------------------
    // Build storage
    // ------------------------------------------------------------
    auto  storage    = jobstore::factory::BuildStorage(config, settings.server_id);
    auto& connection = *storage.connection;

    jobstore::jobs::InvocationRegistry registry;
    RegisterBuiltinHandlers(registry);

    // Register signal handlers before announcing to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const jobstore::connection::ServerContext context{static_cast<int32_t>(settings.worker_count), settings.queues};
    connection.AnnounceServer(settings.server_id, context);

    // ------------------------------------------------------------
    // Start background threads and workers
    // ------------------------------------------------------------
    jobstore::util::CancellationSource cancellation;
    Stopper                            stopper;

    std::vector<std::thread> threads;
    threads.emplace_back(HeartbeatLoop, std::ref(connection), std::cref(settings), std::cref(context), std::ref(stopper));
    threads.emplace_back(HousekeepingLoop, std::ref(connection), std::cref(settings), std::ref(stopper));
    for (uint32_t i = 0; i < settings.worker_count; ++i) {
      threads.emplace_back(WorkerLoop, std::ref(connection), std::cref(registry), std::cref(settings), cancellation.Token(), std::ref(stopper));
    }

    JOBSTORE_LOG_INFO("jobstore worker started", {StringField("server_id", settings.server_id), IntField("workers", settings.worker_count),
                                                  IntField("handlers", static_cast<int64_t>(registry.Size()))});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    JOBSTORE_LOG_INFO("Shutting down jobstore worker");

    cancellation.Cancel();
    stopper.Stop();
    for (auto& thread : threads) {
      thread.join();
    }

    connection.RemoveServer(settings.server_id);
    ShutdownObservability();
  } catch (const std::exception& e) {
    JOBSTORE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
