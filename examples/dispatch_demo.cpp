// dispatch_demo.cpp -- DispatchServer walkthrough.
//
// Demonstrates:
//   1. Loading dispatcher.ini (core/retry/expiry sections, [service.*])
//   2. Registry built from the service collection
//   3. Simulated service workers, one thread per service queue
//   4. Archiving a finished submission
//   5. One expiry round

#include "mwd/archiver.hpp"
#include "mwd/config.hpp"
#include "mwd/datastore.hpp"
#include "mwd/dispatch_config.hpp"
#include "mwd/dispatch_server.hpp"
#include "mwd/expiry.hpp"
#include "mwd/filestore.hpp"
#include "mwd/log.hpp"
#include "mwd/platform.hpp"
#include "mwd/service_registry.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static constexpr int kSubmissions = 12;
static constexpr int64_t kRetentionSec = 7 * 86400;

// ============================================================================
// Simulated workers
// ============================================================================

static std::atomic<bool> g_stop{false};
static std::atomic<uint32_t> g_handled{0};

// "extract" unpacks zip archives into one document; "flaky" fails the first
// delivery of every task; everything else answers with its name.
static void ServeQueue(mwd::DispatchServer& server,
                       std::shared_ptr<mwd::NamedQueue<mwd::ServiceTask>> queue,
                       mwd::MemoryObjectStore& filestore) {
  while (!g_stop.load(std::memory_order_acquire)) {
    auto task = queue->Pop(20U);
    if (!task.has_value()) continue;
    g_handled.fetch_add(1U, std::memory_order_relaxed);

    if (task->service_name == "flaky" && task->attempt == 0U) {
      server.ServiceFailed(*task, "simulated timeout");
      continue;
    }
    mwd::ServiceResult result;
    result.body = {{"service", task->service_name}, {"type", task->file_type}};
    if (task->service_name == "extract" && task->file_type == "archive/zip") {
      const std::string inner = task->sha256 + "-doc";
      filestore.Put(inner, "extracted document");
      result.extracted.push_back(mwd::FileInfo{inner, "document/office", "doc.docx"});
    }
    server.ServiceFinished(*task, result);
  }
}

int main(int argc, char* argv[]) {
  const std::string path = (argc > 1) ? argv[1] : "examples/dispatcher.ini";
  mwd::log::Init();

  // --------------------------------------------------------------------------
  // Configuration
  // --------------------------------------------------------------------------
  mwd::MultiConfig ini;
  auto loaded = ini.LoadFile(path);
  if (!loaded.has_value()) {
    fprintf(stderr, "cannot load %s: %s\n", path.c_str(),
            mwd::ToString(loaded.get_error()));
    return 1;
  }
  auto parsed = mwd::LoadDispatchConfig(ini);
  if (!parsed.has_value()) {
    fprintf(stderr, "invalid configuration in %s\n", path.c_str());
    return 1;
  }
  const mwd::DispatchConfig config = parsed.value();
  mwd::log::SetLevel(config.log_level);

  mwd::Datastore datastore = mwd::Datastore::InMemory();
  for (const auto& def : mwd::ServiceDefinitionsFromConfig(ini)) {
    if (!datastore.service->Save(def.name, nlohmann::json(def)).has_value()) {
      fprintf(stderr, "cannot store service %s\n", def.name.c_str());
      return 1;
    }
  }

  mwd::RegistryCache cache(
      mwd::CollectionRegistrySource(datastore.service, config.stages,
                                    config.categories),
      config.registry_refresh_ms);
  cache.RefreshIfStale(mwd::SteadyNowMs());
  const auto registry = cache.Get();
  printf("\n=== Registry: %zu services, %zu rejected ===\n", registry->Size(),
         registry->Rejected().size());
  for (const auto& kv : registry->Services()) {
    printf("  %-10s stage=%-5s category=%s\n", kv.first.c_str(),
           kv.second->Stage().c_str(), kv.second->Category().c_str());
  }

  // --------------------------------------------------------------------------
  // Dispatch
  // --------------------------------------------------------------------------
  mwd::MemoryObjectStore filestore;
  mwd::QueueHub<mwd::ServiceTask> tasks;
  mwd::NamedQueue<mwd::Submission> submissions("dispatch-submissions");
  mwd::DispatchServer server(config, cache, datastore, tasks, submissions);

  std::atomic<uint32_t> completed{0};
  server.SetCompletionCallback([&completed](const mwd::Submission& s) {
    completed.fetch_add(1U, std::memory_order_relaxed);
    MWD_LOG_INFO("Demo", "%s finished with %zu results, %zu errors",
                 s.sid.c_str(), s.results.size(), s.errors.size());
  });

  auto started = server.Start();
  if (!started.has_value()) {
    fprintf(stderr, "server start failed: %s\n", mwd::ToString(started.get_error()));
    return 1;
  }

  std::vector<std::thread> workers;
  for (const auto& kv : registry->Services()) {
    workers.emplace_back(ServeQueue, std::ref(server), tasks.ForService(kv.first),
                         std::ref(filestore));
  }

  printf("\n=== Submitting %d submissions ===\n", kSubmissions);
  const int64_t now = mwd::WallNowSec();
  for (int i = 0; i < kSubmissions; ++i) {
    mwd::Submission s;
    s.sid = "demo-" + std::to_string(i);
    const std::string sha = "sha-" + std::to_string(i);
    const bool zip = (i % 3 == 0);
    filestore.Put(sha, zip ? "PK..." : "MZ...");
    s.files.push_back(mwd::FileInfo{sha, zip ? "archive/zip" : "executable/windows",
                                    zip ? "bundle.zip" : "setup.exe"});
    if (i % 4 == 1) s.excluded_categories = {"dynamic"};
    s.expiry_ts = now + kRetentionSec;
    if (!server.Submit(std::move(s)).has_value()) {
      fprintf(stderr, "submission queue closed\n");
      break;
    }
  }

  const bool idle = server.WaitIdle(10000U);
  const mwd::DispatchStats stats = server.Stats();
  printf("  idle=%s completed=%u tasks=%u\n", idle ? "yes" : "no",
         completed.load(), g_handled.load());
  printf("  files=%llu emitted=%llu retries=%llu terminal=%llu cache_hits=%llu\n",
         static_cast<unsigned long long>(stats.files_registered),
         static_cast<unsigned long long>(stats.tasks_emitted),
         static_cast<unsigned long long>(stats.retries),
         static_cast<unsigned long long>(stats.terminal_errors),
         static_cast<unsigned long long>(stats.cache_hits));

  server.Stop();
  g_stop.store(true, std::memory_order_release);
  for (auto& t : workers) t.join();

  // --------------------------------------------------------------------------
  // Archive
  // --------------------------------------------------------------------------
  printf("\n=== Archiving demo-0 ===\n");
  mwd::MemoryObjectStore archivestore;
  mwd::NamedQueue<nlohmann::json> archive_queue(config.archive.queue);
  mwd::Archiver archiver(config.archive, datastore, filestore, archivestore,
                         archive_queue);
  (void)archive_queue.Push(mwd::MakeArchiveMessage("submission", "demo-0", false));
  const mwd::ArchiveOutcome outcome = archiver.RunOnce();
  printf("  outcome=%s archived_files=%zu archived_results=%llu\n",
         mwd::ToString(outcome), archivestore.Size(),
         static_cast<unsigned long long>(archiver.Stats().result));

  // --------------------------------------------------------------------------
  // Expiry
  // --------------------------------------------------------------------------
  printf("\n=== Expiry round %lld days ahead ===\n",
         static_cast<long long>(kRetentionSec / 86400 + 1));
  mwd::ExpiryManager expiry(config.expiry, datastore, &filestore, nullptr);
  const mwd::ExpiryReport report = expiry.RunOnce(now + kRetentionSec + 86400);
  for (const auto& kv : report.deleted) {
    printf("  %-12s %llu deleted\n", kv.first.c_str(),
           static_cast<unsigned long long>(kv.second));
  }
  printf("  archived submission kept: %s\n",
         datastore.submission_archive->Exists("demo-0") ? "yes" : "no");

  mwd::log::Shutdown();
  return 0;
}
