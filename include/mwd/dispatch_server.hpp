/**
 * @file dispatch_server.hpp
 * @brief Threaded host for sharded Dispatchers.
 *
 * Architecture:
 *   Submit() -> submission queue -> IngestLoop
 *                                      | fnv1a(sid) % N
 *   ServiceFinished/Failed/Cancel* ----+--> Shard[i].inbox -> ShardLoop
 *                                      |                       |
 *   PeriodicTimer --- Tick ------------+              Dispatcher (owned)
 *        \--- RegistryCache::RefreshIfStale()
 *
 * Every message for one submission lands on the same shard, so its state
 * is only ever touched by that shard's thread. Loops block only in queue
 * pops bounded by poll_timeout_ms, which keeps Stop() responsive.
 */

#ifndef MWD_DISPATCH_SERVER_HPP_
#define MWD_DISPATCH_SERVER_HPP_

#include "mwd/datastore.hpp"
#include "mwd/dispatch_config.hpp"
#include "mwd/dispatcher.hpp"
#include "mwd/log.hpp"
#include "mwd/platform.hpp"
#include "mwd/record.hpp"
#include "mwd/scheduler.hpp"
#include "mwd/service_registry.hpp"
#include "mwd/task_queue.hpp"
#include "mwd/timer.hpp"
#include "mwd/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

namespace mwd {

// ============================================================================
// Shard messages
// ============================================================================

struct FinishSignal {
  ServiceTask task;
  ServiceResult result;
};

struct FailSignal {
  ServiceTask task;
  std::string message;
};

struct CancelSubmissionRequest {
  std::string sid;
};

struct CancelTaskRequest {
  std::string sid;
  std::string sha256;
  std::string service_name;
};

struct TickRequest {
  uint64_t now_ms;
};

using ShardMessage = std::variant<Submission, FinishSignal, FailSignal,
                                  CancelSubmissionRequest, CancelTaskRequest,
                                  TickRequest>;

inline uint32_t ShardOf(const std::string& sid, uint32_t shards) noexcept {
  if (shards <= 1U) return 0U;
  return static_cast<uint32_t>(Fnv1a64(sid.data(), sid.size()) % shards);
}

// ============================================================================
// DispatchServer
// ============================================================================

class DispatchServer final {
 public:
  using CompletionCallback = Dispatcher::CompletionCallback;

  DispatchServer(const DispatchConfig& config, RegistryCache& cache,
                 Datastore& datastore, QueueHub<ServiceTask>& tasks,
                 NamedQueue<Submission>& submissions)
      : config_(config),
        cache_(cache),
        scheduler_(config, cache),
        submissions_(submissions) {
    const uint32_t n = config.shards == 0U ? 1U : config.shards;
    shards_.reserve(n);
    for (uint32_t i = 0U; i < n; ++i) {
      auto shard = std::make_unique<Shard>(i);
      shard->dispatcher = std::make_unique<Dispatcher>(config, scheduler_,
                                                       datastore, tasks);
      Shard* raw = shard.get();
      shard->dispatcher->SetCompletionCallback(
          [this, raw](const Submission& s) { OnComplete(*raw, s); });
      shards_.push_back(std::move(shard));
    }
  }

  ~DispatchServer() { Stop(); }

  DispatchServer(const DispatchServer&) = delete;
  DispatchServer& operator=(const DispatchServer&) = delete;

  /// Must be set before Start().
  void SetCompletionCallback(CompletionCallback cb) { on_complete_ = std::move(cb); }

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  expected<void, TimerError> Start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }

    cache_.RefreshIfStale(SteadyNowMs());

    auto tick = timer_.Add(config_.timer_period_ms, [this] {
      const uint64_t now = SteadyNowMs();
      for (auto& s : shards_) (void)s->inbox.Push(TickRequest{now});
    });
    if (!tick.has_value()) {
      running_.store(false, std::memory_order_release);
      return expected<void, TimerError>::error(tick.get_error());
    }
    if (config_.registry_refresh_ms > 0U) {
      auto refresh = timer_.Add(config_.registry_refresh_ms,
                                [this] { cache_.RefreshIfStale(SteadyNowMs()); });
      if (!refresh.has_value()) {
        running_.store(false, std::memory_order_release);
        return expected<void, TimerError>::error(refresh.get_error());
      }
    }

    for (auto& s : shards_) {
      Shard* raw = s.get();
      raw->thread = std::thread(&DispatchServer::ShardLoop, this, raw);
    }
    ingest_thread_ = std::thread(&DispatchServer::IngestLoop, this);

    auto started = timer_.Start();
    if (!started.has_value()) {
      Stop();
      return started;
    }
    MWD_LOG_INFO("Server", "started: %zu shards, poll %u ms", shards_.size(),
                 config_.poll_timeout_ms);
    return expected<void, TimerError>::success();
  }

  /// Stop all loops and join their threads. Queued messages are dropped.
  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;
    timer_.Stop();
    if (ingest_thread_.joinable()) ingest_thread_.join();
    for (auto& s : shards_) {
      s->inbox.Close();
      if (s->thread.joinable()) s->thread.join();
    }
    MWD_LOG_INFO("Server", "stopped: %llu submissions completed",
                 static_cast<unsigned long long>(CompletedCount()));
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  // --------------------------------------------------------------------------
  // Inputs
  // --------------------------------------------------------------------------

  expected<void, QueueError> Submit(Submission submission) {
    {
      std::lock_guard<std::mutex> lock(idle_mutex_);
      ++submitted_;
    }
    auto r = submissions_.Push(std::move(submission));
    if (!r.has_value()) MarkFinished();
    return r;
  }

  void ServiceFinished(ServiceTask task, ServiceResult result) {
    const std::string sid = task.sid;
    Route(sid, FinishSignal{std::move(task), std::move(result)});
  }

  void ServiceFailed(ServiceTask task, std::string message) {
    const std::string sid = task.sid;
    Route(sid, FailSignal{std::move(task), std::move(message)});
  }

  void CancelSubmission(const std::string& sid) {
    Route(sid, CancelSubmissionRequest{sid});
  }

  void CancelTask(const std::string& sid, const std::string& sha256,
                  const std::string& service_name) {
    Route(sid, CancelTaskRequest{sid, sha256, service_name});
  }

  // --------------------------------------------------------------------------
  // Observation
  // --------------------------------------------------------------------------

  /// Block until every submitted submission has completed or was rejected.
  bool WaitIdle(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                             [this] { return finished_ >= submitted_; });
  }

  uint64_t CompletedCount() const {
    uint64_t n = 0U;
    for (const auto& s : shards_) {
      std::lock_guard<std::mutex> lock(s->stats_mutex);
      n += s->stats.submissions_completed;
    }
    return n;
  }

  /// Sum of per-shard counters as of each shard's last processed message.
  DispatchStats Stats() const {
    DispatchStats total;
    for (const auto& s : shards_) {
      std::lock_guard<std::mutex> lock(s->stats_mutex);
      const DispatchStats& d = s->stats;
      total.submissions_received += d.submissions_received;
      total.submissions_completed += d.submissions_completed;
      total.submissions_cancelled += d.submissions_cancelled;
      total.files_registered += d.files_registered;
      total.tasks_emitted += d.tasks_emitted;
      total.cache_hits += d.cache_hits;
      total.results_saved += d.results_saved;
      total.retries += d.retries;
      total.terminal_errors += d.terminal_errors;
      total.extraction_errors += d.extraction_errors;
      total.duplicates += d.duplicates;
      total.ignored += d.ignored;
      total.tasks_cancelled += d.tasks_cancelled;
      total.store_errors += d.store_errors;
    }
    return total;
  }

  uint32_t ShardCount() const noexcept { return static_cast<uint32_t>(shards_.size()); }

  uint32_t ShardFor(const std::string& sid) const noexcept {
    return ShardOf(sid, ShardCount());
  }

  Scheduler& GetScheduler() noexcept { return scheduler_; }

 private:
  struct Shard {
    explicit Shard(uint32_t idx)
        : index(idx), inbox("dispatch-shard-" + std::to_string(idx)) {}

    uint32_t index;
    NamedQueue<ShardMessage> inbox;
    std::unique_ptr<Dispatcher> dispatcher;
    std::vector<std::string> completed;  ///< Shard thread only.
    std::thread thread;
    mutable std::mutex stats_mutex;
    DispatchStats stats;
  };

  void Route(const std::string& sid, ShardMessage msg) {
    Shard& shard = *shards_[ShardFor(sid)];
    auto r = shard.inbox.Push(std::move(msg));
    if (!r.has_value()) {
      MWD_LOG_WARN("Server", "shard %u closed, signal for %s dropped",
                   shard.index, sid.c_str());
    }
  }

  void IngestLoop() {
    while (running_.load(std::memory_order_acquire)) {
      auto sub = submissions_.Pop(config_.poll_timeout_ms);
      if (!sub.has_value()) continue;
      const std::string sid = sub->sid;
      Shard& shard = *shards_[ShardFor(sid)];
      if (!shard.inbox.Push(std::move(*sub)).has_value()) {
        MWD_LOG_WARN("Server", "shard %u closed, submission %s dropped",
                     shard.index, sid.c_str());
        MarkFinished();
      }
    }
  }

  void ShardLoop(Shard* shard) {
    Dispatcher& d = *shard->dispatcher;
    while (running_.load(std::memory_order_acquire)) {
      auto msg = shard->inbox.Pop(config_.poll_timeout_ms);
      if (!msg.has_value()) continue;

      std::visit(
          overloaded{
              [&](const Submission& s) {
                if (d.GetSubmissionStatus(s.sid).has_value()) {
                  MWD_LOG_DEBUG("Server", "%s already in flight", s.sid.c_str());
                  MarkFinished();
                  return;
                }
                auto r = d.Dispatch(s);
                if (!r.has_value()) {
                  MWD_LOG_WARN("Server", "submission rejected: %s",
                               ToString(r.get_error()));
                  MarkFinished();
                }
              },
              [&](const FinishSignal& f) { (void)d.ServiceFinished(f.task, f.result); },
              [&](const FailSignal& f) { (void)d.ServiceFailed(f.task, f.message); },
              [&](const CancelSubmissionRequest& c) {
                auto r = d.CancelSubmission(c.sid);
                if (!r.has_value()) {
                  MWD_LOG_DEBUG("Server", "cancel %s: %s", c.sid.c_str(),
                                ToString(r.get_error()));
                }
              },
              [&](const CancelTaskRequest& c) {
                auto r = d.CancelTask(c.sid, c.sha256, c.service_name);
                if (!r.has_value()) {
                  MWD_LOG_DEBUG("Server", "cancel %s %s/%s: %s", c.sid.c_str(),
                                c.sha256.c_str(), c.service_name.c_str(),
                                ToString(r.get_error()));
                }
              },
              [&](const TickRequest& t) { (void)d.ReleaseDueRetries(t.now_ms); },
          },
          *msg);

      {
        std::lock_guard<std::mutex> lock(shard->stats_mutex);
        shard->stats = d.Stats();
      }
      // Published stats already include these completions.
      for (const auto& sid : shard->completed) {
        d.Forget(sid);
        MarkFinished();
      }
      shard->completed.clear();
    }
  }

  /// Runs on the shard thread, inside the Dispatcher.
  void OnComplete(Shard& shard, const Submission& s) {
    shard.completed.push_back(s.sid);
    if (on_complete_) on_complete_(s);
  }

  void MarkFinished() {
    {
      std::lock_guard<std::mutex> lock(idle_mutex_);
      ++finished_;
    }
    idle_cv_.notify_all();
  }

  DispatchConfig config_;
  RegistryCache& cache_;
  Scheduler scheduler_;
  NamedQueue<Submission>& submissions_;
  std::vector<std::unique_ptr<Shard>> shards_;
  PeriodicTimer timer_;
  CompletionCallback on_complete_;

  std::atomic<bool> running_{false};
  std::thread ingest_thread_;

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  uint64_t submitted_ = 0U;
  uint64_t finished_ = 0U;
};

}  // namespace mwd

#endif  // MWD_DISPATCH_SERVER_HPP_
