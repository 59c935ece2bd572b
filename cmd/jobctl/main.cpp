#include <chrono>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/jobs/invocation.hpp"
#include "internal/monitoring/monitoring_api.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using jobstore::util::ToIso8601;

static void Usage() {
  std::cout << "Usage:\n"
            << "  jobctl --config <file> enqueue <queue> <invocation-json>\n"
            << "  jobctl --config <file> stats\n"
            << "  jobctl --config <file> job <job_id>\n"
            << "  jobctl --config <file> servers\n"
            << "  jobctl --config <file> queues\n"
            << "  jobctl --config <file> purge\n";
}

static void PrintJob(const jobstore::monitoring::JobSummary& job) {
  std::cout << job.job_id << "  " << job.state << "  " << jobstore::jobs::Signature(job.invocation) << "  created=" << ToIso8601(job.created_at)
            << "\n";
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = jobstore::config::ConfigLoader::LoadFromYaml(config_path);
    jobstore::observability::InitializeLogging(config);

    auto  storage    = jobstore::factory::BuildStorage(config);
    auto& connection = *storage.connection;

    jobstore::monitoring::MonitoringApi monitoring(connection);

    // ------------------------------------------------------------

    if (cmd == "enqueue") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      const std::string queue      = argv[4];
      const auto        invocation = jobstore::jobs::ParseInvocation(argv[5]);
      jobstore::jobs::ValidateInvocation(invocation);

      const auto job_id = connection.CreateExpiredJob(invocation, queue, {}, connection.Options().default_job_expiration);

      auto batch = connection.CreateWriteBatch();
      batch->AddToQueue(queue, job_id);
      batch->Commit();

      std::cout << job_id << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      const auto stats = monitoring.GetStatistics();
      std::cout << "enqueued=" << stats.enqueued << "\n"
                << "scheduled=" << stats.scheduled << "\n"
                << "processing=" << stats.processing << "\n"
                << "succeeded=" << stats.succeeded << "\n"
                << "failed=" << stats.failed << "\n"
                << "deleted=" << stats.deleted << "\n"
                << "servers=" << stats.servers << "\n"
                << "queues=" << stats.queues << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "job") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      const auto details = monitoring.GetJobDetails(argv[4]);
      if (!details) {
        std::cerr << "job not found: " << argv[4] << "\n";
        return 2;
      }

      std::cout << "id=" << details->job_id << "\n"
                << "queue=" << details->queue << "\n"
                << "invocation=" << jobstore::jobs::SerializeInvocation(details->invocation) << "\n"
                << "created=" << ToIso8601(details->created_at) << "\n";
      if (details->expire_at) {
        std::cout << "expires=" << ToIso8601(*details->expire_at) << "\n";
      }
      for (const auto& [name, value] : details->parameters) {
        std::cout << "param " << name << "=" << value << "\n";
      }
      for (const auto& entry : details->history) {
        std::cout << ToIso8601(entry.created_at) << "  " << entry.state << "  " << entry.reason << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "servers") {
      for (const auto& server : monitoring.Servers()) {
        std::cout << server.server_id << "  workers=" << server.worker_count << "  started=" << ToIso8601(server.started_at)
                  << "  heartbeat=" << ToIso8601(server.last_heartbeat) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "queues") {
      for (const auto& queue : monitoring.Queues()) {
        std::cout << queue.name << "  length=" << queue.length << "  fetched=" << queue.fetched << "\n";
        for (const auto& job : queue.first_jobs) {
          std::cout << "  ";
          PrintJob(job);
        }
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "purge") {
      std::cout << "purged=" << connection.Store().PurgeExpired() << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    jobstore::observability::ShutdownLogging();
    return 2;
  }

  Usage();
  return 1;
}
