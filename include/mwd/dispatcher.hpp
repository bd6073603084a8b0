/**
 * @file dispatcher.hpp
 * @brief Submission / file / service state machine.
 *
 * Drives every file of a submission, declared or extracted, through its
 * stage plan:
 *
 *   kPending --EnterStage--> kAwaiting --all resolved--> kAdvancing
 *       ^                                                    |
 *       +---------------- next non-empty stage --------------+
 *                                                            |
 *                         no stage left / extraction error   v
 *                                                          kDone
 *
 * A service slot is resolved by a finish signal, a cache hit, a terminal
 * failure or a cancellation. The submission completes when every file is
 * kDone.
 *
 * Not thread-safe: one Dispatcher is owned by exactly one shard thread.
 * The Scheduler, Datastore and QueueHub it references are shared and
 * thread-safe.
 */

#ifndef MWD_DISPATCHER_HPP_
#define MWD_DISPATCHER_HPP_

#include "mwd/config_hash.hpp"
#include "mwd/datastore.hpp"
#include "mwd/dispatch_config.hpp"
#include "mwd/log.hpp"
#include "mwd/platform.hpp"
#include "mwd/record.hpp"
#include "mwd/scheduler.hpp"
#include "mwd/task_queue.hpp"
#include "mwd/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mwd {

// ============================================================================
// States and outcomes
// ============================================================================

enum class FileState : uint8_t {
  kPending = 0,  ///< Registered, stage not entered yet.
  kAwaiting,     ///< Tasks of the current stage outstanding.
  kAdvancing,    ///< Current stage resolved, moving on.
  kDone,
};

inline const char* ToString(FileState s) noexcept {
  switch (s) {
    case FileState::kPending: return "pending";
    case FileState::kAwaiting: return "awaiting";
    case FileState::kAdvancing: return "advancing";
    case FileState::kDone: return "done";
  }
  return "unknown";
}

/// What a worker signal did to the state machine.
enum class SignalOutcome : uint8_t {
  kApplied = 0,  ///< Result recorded, slot resolved.
  kRetried,      ///< Failure under the limit, retry scheduled.
  kTerminal,     ///< Failure at the limit, error recorded, slot resolved.
  kDuplicate,    ///< Slot already resolved or stale attempt.
  kIgnored,      ///< Unknown or completed submission, unknown file.
};

/** Payload of a finish signal. */
struct ServiceResult {
  nlohmann::json body = nlohmann::json::object();
  std::vector<FileInfo> extracted;
  std::vector<FileInfo> supplementary;
};

struct DispatchStats {
  uint64_t submissions_received = 0U;
  uint64_t submissions_completed = 0U;
  uint64_t submissions_cancelled = 0U;
  uint64_t files_registered = 0U;
  uint64_t tasks_emitted = 0U;
  uint64_t cache_hits = 0U;
  uint64_t results_saved = 0U;
  uint64_t retries = 0U;
  uint64_t terminal_errors = 0U;
  uint64_t extraction_errors = 0U;
  uint64_t duplicates = 0U;
  uint64_t ignored = 0U;
  uint64_t tasks_cancelled = 0U;
  uint64_t store_errors = 0U;
};

// ============================================================================
// RetryPolicy
// ============================================================================

/**
 * @brief delay(n) = min(base * 2^(n-1), max) + uniform[0, jitter] ms.
 *
 * A zero base disables the delay altogether, jitter included.
 */
class RetryPolicy final {
 public:
  explicit RetryPolicy(const RetryPolicyConfig& cfg,
                       uint32_t seed = std::random_device{}())
      : cfg_(cfg), rng_(seed) {}

  uint64_t DelayMs(uint32_t retry) {
    if (cfg_.base_ms == 0U) return 0U;
    const uint32_t shift = (retry == 0U) ? 0U : std::min<uint32_t>(retry - 1U, 31U);
    const uint64_t grown = static_cast<uint64_t>(cfg_.base_ms) << shift;
    uint64_t delay = std::min<uint64_t>(grown, cfg_.max_ms);
    if (cfg_.jitter_ms > 0U) {
      std::uniform_int_distribution<uint32_t> dist(0U, cfg_.jitter_ms);
      delay += dist(rng_);
    }
    return delay;
  }

  /// Largest value DelayMs() can return.
  uint64_t MaxDelayMs() const noexcept {
    if (cfg_.base_ms == 0U) return 0U;
    return static_cast<uint64_t>(cfg_.max_ms) + cfg_.jitter_ms;
  }

 private:
  RetryPolicyConfig cfg_;
  std::mt19937 rng_;
};

// ============================================================================
// Dispatcher
// ============================================================================

class Dispatcher final {
 public:
  using CompletionCallback = std::function<void(const Submission&)>;
  using Clock = std::function<uint64_t()>;

  Dispatcher(const DispatchConfig& config, Scheduler& scheduler,
             Datastore& datastore, QueueHub<ServiceTask>& queues,
             Clock clock = &SteadyNowMs,
             uint32_t seed = std::random_device{}())
      : max_depth_(config.max_extraction_depth),
        scheduler_(scheduler),
        datastore_(datastore),
        queues_(queues),
        clock_(std::move(clock)),
        retry_(config.retry, seed) {}

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void SetCompletionCallback(CompletionCallback cb) { on_complete_ = std::move(cb); }

  // --------------------------------------------------------------------------
  // Ingest
  // --------------------------------------------------------------------------

  /**
   * @brief Register a submission and start every declared file.
   *
   * Re-dispatching a sid that is still tracked is a no-op. A submission
   * without files completes immediately.
   */
  expected<void, DispatchError> Dispatch(const Submission& submission) {
    if (submission.sid.empty()) {
      MWD_LOG_WARN("Dispatch", "submission without sid dropped");
      return expected<void, DispatchError>::error(DispatchError::kInvalidSubmission);
    }
    if (submissions_.count(submission.sid) != 0U) {
      MWD_LOG_DEBUG("Dispatch", "%s already dispatched", submission.sid.c_str());
      return expected<void, DispatchError>::success();
    }

    SubmissionEntry& sub = submissions_[submission.sid];
    sub.record = submission;
    sub.record.status = SubmissionStatus::kIncomplete;
    ++stats_.submissions_received;
    Persist(*datastore_.submission, sub.record.sid, sub.record);
    MWD_LOG_INFO("Dispatch", "%s: %zu files", sub.record.sid.c_str(),
                 sub.record.files.size());

    for (size_t i = 0U; i < submission.files.size(); ++i) {
      const FileInfo& f = submission.files[i];
      if (f.sha256.empty() || f.type.empty()) {
        RecordExtractionError(sub, f,
                              BuildErrorKey(sub.record.sid + ".f" + std::to_string(i)),
                              0U, "declared file has no hash or type");
        continue;
      }
      RegisterFile(sub, f, 0U);
    }
    Pump(sub);
    return expected<void, DispatchError>::success();
  }

  // --------------------------------------------------------------------------
  // Worker signals
  // --------------------------------------------------------------------------

  SignalOutcome ServiceFinished(const ServiceTask& task, const ServiceResult& result) {
    SubmissionEntry* sub = nullptr;
    FileEntry* file = nullptr;
    ServiceSlot* slot = nullptr;
    const SignalOutcome pre = Locate(task, sub, file, slot);
    if (pre != SignalOutcome::kApplied) return pre;

    DropPendingRetry(task.sid, task.sha256, task.service_name);
    ApplySuccess(*sub, *file, *slot, result.body, result.extracted,
                 result.supplementary);
    CloseStageIfResolved(*sub, *file);
    Pump(*sub);
    return SignalOutcome::kApplied;
  }

  SignalOutcome ServiceFailed(const ServiceTask& task, const std::string& message) {
    SubmissionEntry* sub = nullptr;
    FileEntry* file = nullptr;
    ServiceSlot* slot = nullptr;
    const SignalOutcome pre = Locate(task, sub, file, slot);
    if (pre != SignalOutcome::kApplied) return pre;

    if (task.attempt != slot->retries) {
      ++stats_.duplicates;
      return SignalOutcome::kDuplicate;
    }

    const uint32_t limit = slot->service->FailureLimit();
    if (slot->retries < limit) {
      ++slot->retries;
      ++stats_.retries;
      ServiceTask retry = MakeTask(sub->record.sid, *file, *slot);
      const uint64_t delay = retry_.DelayMs(slot->retries);
      pending_retries_.push_back(PendingRetry{clock_() + delay, std::move(retry)});
      MWD_LOG_INFO("Dispatch", "%s %s/%s failed (%s), retry %u/%u in %llu ms",
                   task.sid.c_str(), task.sha256.c_str(),
                   task.service_name.c_str(), message.c_str(), slot->retries,
                   limit, static_cast<unsigned long long>(delay));
      if (delay == 0U) (void)ReleaseDueRetries(clock_());
      return SignalOutcome::kRetried;
    }

    MWD_LOG_WARN("Dispatch", "%s %s/%s terminal after %u attempts: %s",
                 task.sid.c_str(), task.sha256.c_str(), task.service_name.c_str(),
                 slot->retries + 1U, message.c_str());
    FailSlot(*sub, *file, *slot, message);
    CloseStageIfResolved(*sub, *file);
    Pump(*sub);
    return SignalOutcome::kTerminal;
  }

  // --------------------------------------------------------------------------
  // Cancellation
  // --------------------------------------------------------------------------

  /// Drop all outstanding work of a submission and complete it as cancelled.
  expected<void, DispatchError> CancelSubmission(const std::string& sid) {
    auto it = submissions_.find(sid);
    if (it == submissions_.end()) {
      return expected<void, DispatchError>::error(DispatchError::kUnknownSubmission);
    }
    SubmissionEntry& sub = it->second;
    if (sub.record.status == SubmissionStatus::kComplete) {
      return expected<void, DispatchError>::error(DispatchError::kAlreadyComplete);
    }

    for (auto& kv : sub.files) {
      FileEntry& file = kv.second;
      for (auto& s : file.slots) {
        if (s.second.outstanding) {
          s.second.outstanding = false;
          ++stats_.tasks_cancelled;
        }
      }
      file.state = FileState::kDone;
    }
    sub.advance.clear();
    pending_retries_.erase(
        std::remove_if(pending_retries_.begin(), pending_retries_.end(),
                       [&sid](const PendingRetry& r) { return r.task.sid == sid; }),
        pending_retries_.end());

    sub.record.cancelled = true;
    ++stats_.submissions_cancelled;
    MWD_LOG_INFO("Dispatch", "%s cancelled", sid.c_str());
    CheckCompletion(sub);
    return expected<void, DispatchError>::success();
  }

  /// Resolve one outstanding task without success or failure.
  expected<void, DispatchError> CancelTask(const std::string& sid,
                                           const std::string& sha256,
                                           const std::string& service_name) {
    auto it = submissions_.find(sid);
    if (it == submissions_.end()) {
      return expected<void, DispatchError>::error(DispatchError::kUnknownSubmission);
    }
    SubmissionEntry& sub = it->second;
    if (sub.record.status == SubmissionStatus::kComplete) {
      return expected<void, DispatchError>::error(DispatchError::kAlreadyComplete);
    }
    auto fit = sub.files.find(sha256);
    if (fit == sub.files.end()) {
      return expected<void, DispatchError>::error(DispatchError::kUnknownFile);
    }
    FileEntry& file = fit->second;
    auto sit = file.slots.find(service_name);
    if (file.state != FileState::kAwaiting || sit == file.slots.end() ||
        !sit->second.outstanding) {
      return expected<void, DispatchError>::error(DispatchError::kNotOutstanding);
    }

    DropPendingRetry(sid, sha256, service_name);
    sit->second.outstanding = false;
    ++stats_.tasks_cancelled;
    MWD_LOG_INFO("Dispatch", "%s %s/%s cancelled", sid.c_str(), sha256.c_str(),
                 service_name.c_str());
    CloseStageIfResolved(sub, file);
    Pump(sub);
    return expected<void, DispatchError>::success();
  }

  // --------------------------------------------------------------------------
  // Retries
  // --------------------------------------------------------------------------

  /// Push every retry whose backoff has expired. @return tasks pushed.
  size_t ReleaseDueRetries(uint64_t now_ms) {
    std::vector<ServiceTask> due;
    for (auto it = pending_retries_.begin(); it != pending_retries_.end();) {
      if (it->due_ms <= now_ms) {
        due.push_back(std::move(it->task));
        it = pending_retries_.erase(it);
      } else {
        ++it;
      }
    }
    size_t pushed = 0U;
    for (auto& task : due) {
      SubmissionEntry* sub = nullptr;
      FileEntry* file = nullptr;
      ServiceSlot* slot = nullptr;
      if (Locate(task, sub, file, slot, false) != SignalOutcome::kApplied ||
          task.attempt != slot->retries) {
        continue;
      }
      if (Emit(task)) {
        ++pushed;
        continue;
      }
      FailSlot(*sub, *file, *slot, "service queue closed");
      CloseStageIfResolved(*sub, *file);
      Pump(*sub);
    }
    return pushed;
  }

  size_t PendingRetryCount() const noexcept { return pending_retries_.size(); }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  expected<SubmissionStatus, DispatchError> GetSubmissionStatus(
      const std::string& sid) const {
    auto it = submissions_.find(sid);
    if (it == submissions_.end()) {
      return expected<SubmissionStatus, DispatchError>::error(
          DispatchError::kUnknownSubmission);
    }
    return expected<SubmissionStatus, DispatchError>::success(it->second.record.status);
  }

  expected<Submission, DispatchError> GetSubmission(const std::string& sid) const {
    auto it = submissions_.find(sid);
    if (it == submissions_.end()) {
      return expected<Submission, DispatchError>::error(
          DispatchError::kUnknownSubmission);
    }
    return expected<Submission, DispatchError>::success(it->second.record);
  }

  expected<FileState, DispatchError> GetFileState(const std::string& sid,
                                                  const std::string& sha256) const {
    const FileEntry* file = nullptr;
    auto r = FindFile(sid, sha256, file);
    if (!r.has_value()) return expected<FileState, DispatchError>::error(r.get_error());
    return expected<FileState, DispatchError>::success(file->state);
  }

  /// Services of the file's current stage still waiting for a signal.
  expected<std::vector<std::string>, DispatchError> OutstandingServices(
      const std::string& sid, const std::string& sha256) const {
    using R = expected<std::vector<std::string>, DispatchError>;
    const FileEntry* file = nullptr;
    auto r = FindFile(sid, sha256, file);
    if (!r.has_value()) return R::error(r.get_error());
    std::vector<std::string> out;
    for (const auto& kv : file->slots) {
      if (kv.second.outstanding) out.push_back(kv.first);
    }
    return R::success(std::move(out));
  }

  /// Extraction error annotation of a file, if any.
  expected<std::optional<std::string>, DispatchError> FileError(
      const std::string& sid, const std::string& sha256) const {
    using R = expected<std::optional<std::string>, DispatchError>;
    const FileEntry* file = nullptr;
    auto r = FindFile(sid, sha256, file);
    if (!r.has_value()) return R::error(r.get_error());
    return R::success(file->error);
  }

  /// Every file (declared or extracted) tracked for the submission.
  std::vector<std::string> Files(const std::string& sid) const {
    std::vector<std::string> out;
    auto it = submissions_.find(sid);
    if (it == submissions_.end()) return out;
    for (const auto& kv : it->second.files) out.push_back(kv.first);
    return out;
  }

  size_t ActiveCount() const noexcept {
    size_t n = 0U;
    for (const auto& kv : submissions_) {
      if (kv.second.record.status != SubmissionStatus::kComplete) ++n;
    }
    return n;
  }

  const DispatchStats& Stats() const noexcept { return stats_; }

  /// Drop all state of a submission; later signals for it are ignored.
  void Forget(const std::string& sid) {
    submissions_.erase(sid);
    pending_retries_.erase(
        std::remove_if(pending_retries_.begin(), pending_retries_.end(),
                       [&sid](const PendingRetry& r) { return r.task.sid == sid; }),
        pending_retries_.end());
  }

 private:
  // --------------------------------------------------------------------------
  // Internal types
  // --------------------------------------------------------------------------

  struct ServiceSlot {
    ServicePtr service;
    std::string config_hash;
    std::string result_key;
    uint32_t retries = 0U;
    bool outstanding = true;
  };

  struct FileEntry {
    FileInfo info;
    uint32_t depth = 0U;
    Schedule schedule;
    uint32_t stage = 0U;
    FileState state = FileState::kPending;
    std::map<std::string, ServiceSlot> slots;  ///< Current stage only.
    std::set<std::string> succeeded;           ///< Current stage only.
    std::set<std::string> failed;              ///< Current stage only.
    std::optional<std::string> error;
  };

  struct SubmissionEntry {
    Submission record;
    std::map<std::string, FileEntry> files;  ///< By sha256.
    std::deque<std::string> advance;         ///< Files to (re-)enter a stage.
  };

  struct PendingRetry {
    uint64_t due_ms;
    ServiceTask task;
  };

  // --------------------------------------------------------------------------
  // Registration
  // --------------------------------------------------------------------------

  void RegisterFile(SubmissionEntry& sub, const FileInfo& info, uint32_t depth) {
    if (sub.files.count(info.sha256) != 0U) return;
    FileEntry& file = sub.files[info.sha256];
    file.info = info;
    file.depth = depth;
    file.schedule = scheduler_.BuildSchedule(sub.record, info.type);
    ++stats_.files_registered;

    FileRecord rec;
    rec.sha256 = info.sha256;
    rec.type = info.type;
    rec.expiry_ts = sub.record.expiry_ts;
    Persist(*datastore_.file, info.sha256, rec);

    sub.advance.push_back(info.sha256);
  }

  /// Annotate an unusable file and count it as done.
  void RecordExtractionError(SubmissionEntry& sub, const FileInfo& info,
                             const std::string& key, uint32_t depth,
                             const std::string& message) {
    ++stats_.extraction_errors;
    MWD_LOG_WARN("Dispatch", "%s file '%s': %s", sub.record.sid.c_str(),
                 info.sha256.c_str(), message.c_str());
    if (!key.empty()) {
      ErrorRecord err;
      err.sha256 = info.sha256;
      err.kind = ErrorKind::kExtraction;
      err.message = message;
      err.expiry_ts = sub.record.expiry_ts;
      Persist(*datastore_.error, key, err);
      sub.record.errors.push_back(key);
    }
    if (info.sha256.empty() || sub.files.count(info.sha256) != 0U) return;
    FileEntry& file = sub.files[info.sha256];
    file.info = info;
    file.depth = depth;
    file.state = FileState::kDone;
    file.error = message;
  }

  // --------------------------------------------------------------------------
  // Stage machine
  // --------------------------------------------------------------------------

  /// Enter stages for every queued file until nothing moves, then check
  /// for completion.
  void Pump(SubmissionEntry& sub) {
    while (!sub.advance.empty()) {
      const std::string sha = sub.advance.front();
      sub.advance.pop_front();
      auto it = sub.files.find(sha);
      if (it == sub.files.end() || it->second.state == FileState::kDone) continue;
      EnterStage(sub, it->second);
    }
    CheckCompletion(sub);
  }

  void EnterStage(SubmissionEntry& sub, FileEntry& file) {
    file.slots.clear();
    file.succeeded.clear();
    file.failed.clear();

    const auto& buckets = file.schedule.buckets;
    while (file.stage < buckets.size() && buckets[file.stage].empty()) {
      ++file.stage;
    }
    if (file.stage >= buckets.size()) {
      file.state = FileState::kDone;
      MWD_LOG_DEBUG("Dispatch", "%s %s done", sub.record.sid.c_str(),
                    file.info.sha256.c_str());
      return;
    }

    file.state = FileState::kAwaiting;
    for (const auto& kv : buckets[file.stage]) {
      ServiceSlot slot;
      slot.service = kv.second;
      slot.config_hash = ConfigHash(EffectiveServiceConfig(*kv.second, sub.record));
      slot.result_key = BuildResultKey(file.info.sha256, kv.first,
                                       kv.second->Version(), slot.config_hash);
      file.slots.emplace(kv.first, std::move(slot));
    }

    for (auto& kv : file.slots) {
      ServiceSlot& slot = kv.second;
      auto cached = LoadRecord<ResultRecord>(*datastore_.result, slot.result_key);
      if (cached.has_value()) {
        ++stats_.cache_hits;
        MWD_LOG_DEBUG("Dispatch", "%s cache hit %s", sub.record.sid.c_str(),
                      slot.result_key.c_str());
        const ResultRecord& hit = cached.value();
        ApplySuccess(sub, file, slot, hit.body, hit.extracted, hit.supplementary,
                     false);
        continue;
      }
      if (!Emit(MakeTask(sub.record.sid, file, slot))) {
        FailSlot(sub, file, slot, "service queue closed");
      }
    }
    CloseStageIfResolved(sub, file);
  }

  void CloseStageIfResolved(SubmissionEntry& sub, FileEntry& file) {
    if (file.state != FileState::kAwaiting) return;
    for (const auto& kv : file.slots) {
      if (kv.second.outstanding) return;
    }
    file.state = FileState::kAdvancing;
    ++file.stage;
    sub.advance.push_back(file.info.sha256);
  }

  void ApplySuccess(SubmissionEntry& sub, FileEntry& file, ServiceSlot& slot,
                    const nlohmann::json& body,
                    const std::vector<FileInfo>& extracted,
                    const std::vector<FileInfo>& supplementary,
                    bool persist = true) {
    slot.outstanding = false;
    file.succeeded.insert(slot.service->Name());

    if (persist) {
      ResultRecord rec;
      rec.sha256 = file.info.sha256;
      rec.service_name = slot.service->Name();
      rec.version = slot.service->Version();
      rec.config_hash = slot.config_hash;
      rec.body = body;
      rec.extracted = extracted;
      rec.supplementary = supplementary;
      rec.expiry_ts = sub.record.expiry_ts;
      if (Persist(*datastore_.result, slot.result_key, rec)) ++stats_.results_saved;
    }
    sub.record.results.push_back(slot.result_key);

    const uint32_t child_depth = file.depth + 1U;
    for (size_t i = 0U; i < extracted.size(); ++i) {
      const FileInfo& child = extracted[i];
      if (!child.sha256.empty() && sub.files.count(child.sha256) != 0U) continue;
      if (child.sha256.empty() || child.type.empty()) {
        RecordExtractionError(sub, child,
                              BuildExtractionErrorKey(slot.result_key, i),
                              child_depth, "extracted file has no hash or type");
        continue;
      }
      if (child_depth > max_depth_) {
        RecordExtractionError(sub, child,
                              BuildExtractionErrorKey(slot.result_key, i),
                              child_depth, "extraction depth limit reached");
        continue;
      }
      RegisterFile(sub, child, child_depth);
    }
  }

  /// Resolve a slot with a terminal error; the caller closes the stage.
  void FailSlot(SubmissionEntry& sub, FileEntry& file, ServiceSlot& slot,
                const std::string& message) {
    ErrorRecord err;
    err.sha256 = file.info.sha256;
    err.service_name = slot.service->Name();
    err.kind = ErrorKind::kTerminal;
    err.message = message;
    err.attempts = slot.retries + 1U;
    err.expiry_ts = sub.record.expiry_ts;
    const std::string key = BuildErrorKey(slot.result_key);
    Persist(*datastore_.error, key, err);
    sub.record.errors.push_back(key);
    ++stats_.terminal_errors;
    slot.outstanding = false;
    file.failed.insert(slot.service->Name());
  }

  void CheckCompletion(SubmissionEntry& sub) {
    if (sub.record.status == SubmissionStatus::kComplete) return;
    for (const auto& kv : sub.files) {
      if (kv.second.state != FileState::kDone) return;
    }
    sub.record.status = SubmissionStatus::kComplete;
    ++stats_.submissions_completed;
    Persist(*datastore_.submission, sub.record.sid, sub.record);
    MWD_LOG_INFO("Dispatch", "%s complete: %zu files, %zu results, %zu errors%s",
                 sub.record.sid.c_str(), sub.files.size(),
                 sub.record.results.size(), sub.record.errors.size(),
                 sub.record.cancelled ? " (cancelled)" : "");
    if (on_complete_) on_complete_(sub.record);
  }

  // --------------------------------------------------------------------------
  // Helpers
  // --------------------------------------------------------------------------

  ServiceTask MakeTask(const std::string& sid, const FileEntry& file,
                       const ServiceSlot& slot) const {
    ServiceTask t;
    t.sid = sid;
    t.sha256 = file.info.sha256;
    t.file_type = file.info.type;
    t.service_name = slot.service->Name();
    t.config_hash = slot.config_hash;
    t.attempt = slot.retries;
    t.depth = file.depth;
    return t;
  }

  bool Emit(const ServiceTask& task) {
    auto r = queues_.ForService(task.service_name)->Push(task);
    if (!r.has_value()) {
      MWD_LOG_WARN("Dispatch", "queue for '%s' closed, task %s/%s dropped",
                   task.service_name.c_str(), task.sid.c_str(), task.sha256.c_str());
      return false;
    }
    ++stats_.tasks_emitted;
    return true;
  }

  /**
   * Resolve a task to its live slot. Returns kApplied when the slot is
   * outstanding, kIgnored / kDuplicate otherwise.
   */
  SignalOutcome Locate(const ServiceTask& task, SubmissionEntry*& sub,
                       FileEntry*& file, ServiceSlot*& slot, bool count = true) {
    auto it = submissions_.find(task.sid);
    if (it == submissions_.end() ||
        it->second.record.status == SubmissionStatus::kComplete) {
      if (count) ++stats_.ignored;
      return SignalOutcome::kIgnored;
    }
    auto fit = it->second.files.find(task.sha256);
    if (fit == it->second.files.end()) {
      if (count) ++stats_.ignored;
      return SignalOutcome::kIgnored;
    }
    auto sit = fit->second.slots.find(task.service_name);
    if (fit->second.state != FileState::kAwaiting || sit == fit->second.slots.end() ||
        !sit->second.outstanding) {
      if (count) ++stats_.duplicates;
      return SignalOutcome::kDuplicate;
    }
    sub = &it->second;
    file = &fit->second;
    slot = &sit->second;
    return SignalOutcome::kApplied;
  }

  expected<void, DispatchError> FindFile(const std::string& sid,
                                         const std::string& sha256,
                                         const FileEntry*& file) const {
    auto it = submissions_.find(sid);
    if (it == submissions_.end()) {
      return expected<void, DispatchError>::error(DispatchError::kUnknownSubmission);
    }
    auto fit = it->second.files.find(sha256);
    if (fit == it->second.files.end()) {
      return expected<void, DispatchError>::error(DispatchError::kUnknownFile);
    }
    file = &fit->second;
    return expected<void, DispatchError>::success();
  }

  void DropPendingRetry(const std::string& sid, const std::string& sha256,
                        const std::string& service_name) {
    pending_retries_.erase(
        std::remove_if(pending_retries_.begin(), pending_retries_.end(),
                       [&](const PendingRetry& r) {
                         return r.task.sid == sid && r.task.sha256 == sha256 &&
                                r.task.service_name == service_name;
                       }),
        pending_retries_.end());
  }

  template <typename T>
  bool Persist(Collection& c, const std::string& id, const T& record) {
    if (SaveRecord(c, id, record).has_value()) return true;
    ++stats_.store_errors;
    return false;
  }

  // --------------------------------------------------------------------------
  // Data members
  // --------------------------------------------------------------------------

  uint32_t max_depth_;
  Scheduler& scheduler_;
  Datastore& datastore_;
  QueueHub<ServiceTask>& queues_;
  Clock clock_;
  RetryPolicy retry_;
  CompletionCallback on_complete_;

  std::map<std::string, SubmissionEntry> submissions_;
  std::vector<PendingRetry> pending_retries_;
  DispatchStats stats_;
};

}  // namespace mwd

#endif  // MWD_DISPATCHER_HPP_
