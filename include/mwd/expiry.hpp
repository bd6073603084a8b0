/**
 * @file expiry.hpp
 * @brief Periodic deletion of records (and their blobs) past expiry_ts.
 *
 * Each round walks the expirable collections. Records whose expiry_ts is at
 * or before now - delay_hours (rounded down to the day with batch_delete)
 * are deleted. When delete_storage is on, the blobs of the file and
 * cached_file collections go first, fanned out over a TaskGroup; a blob
 * that is already gone counts as deleted, any other blob failure leaves the
 * collection's records in place until the next round.
 */

#ifndef MWD_EXPIRY_HPP_
#define MWD_EXPIRY_HPP_

#include "mwd/datastore.hpp"
#include "mwd/dispatch_config.hpp"
#include "mwd/filestore.hpp"
#include "mwd/log.hpp"
#include "mwd/platform.hpp"
#include "mwd/task_group.hpp"
#include "mwd/timer.hpp"
#include "mwd/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace mwd {

struct ExpiryReport {
  std::map<std::string, uint64_t> deleted;        ///< Records, per collection.
  std::map<std::string, uint64_t> blobs_deleted;  ///< Blobs, per collection.
  std::vector<std::string> skipped;               ///< Blob deletion failed.
};

class ExpiryManager final {
 public:
  static constexpr int64_t kSecondsPerHour = 3600;
  static constexpr int64_t kSecondsPerDay = 86400;

  /**
   * @param filestore   Blob store of the file collection, may be nullptr.
   * @param cachestore  Blob store of the cached_file collection, may be nullptr.
   */
  ExpiryManager(const ExpiryConfig& config, Datastore& datastore,
                ObjectStore* filestore, ObjectStore* cachestore)
      : config_(config),
        datastore_(datastore),
        filestore_(filestore),
        cachestore_(cachestore) {}

  ~ExpiryManager() { Stop(); }

  ExpiryManager(const ExpiryManager&) = delete;
  ExpiryManager& operator=(const ExpiryManager&) = delete;

  /// Records with expiry_ts <= Deadline(now) are due.
  int64_t Deadline(int64_t now_sec) const noexcept {
    int64_t deadline =
        now_sec - static_cast<int64_t>(config_.delay_hours) * kSecondsPerHour;
    if (config_.batch_delete) {
      deadline -= ((deadline % kSecondsPerDay) + kSecondsPerDay) % kSecondsPerDay;
    }
    return deadline;
  }

  ExpiryReport RunOnce(int64_t now_sec) {
    ExpiryReport report;
    Query due;
    due.Range("expiry_ts", std::nullopt, static_cast<double>(Deadline(now_sec)));

    for (const auto& collection : datastore_.ExpirableCollections()) {
      const std::string& name = collection->Name();
      const uint64_t to_delete = collection->Count(due);
      MWD_LOG_DEBUG("Expiry", "processing collection: %s", name.c_str());
      if (to_delete == 0U) {
        MWD_LOG_DEBUG("Expiry", "    nothing to delete in %s", name.c_str());
        continue;
      }

      ObjectStore* blobs = BlobStoreFor(name);
      if (config_.delete_storage && blobs != nullptr) {
        auto r = DeleteBlobs(*collection, due, *blobs, report);
        if (!r.has_value()) {
          report.skipped.push_back(name);
          continue;
        }
      }

      const uint64_t n = collection->DeleteMatching(due);
      report.deleted[name] = n;
      total_deleted_.fetch_add(n, std::memory_order_relaxed);
      MWD_LOG_INFO("Expiry", "    deleted %llu items from %s",
                   static_cast<unsigned long long>(n), name.c_str());
    }
    return report;
  }

  /// Run a round every sleep_time_s on a background timer. The sweep task
  /// is registered once and survives Stop() for a later restart.
  expected<void, TimerError> Start() {
    if (timer_.IsRunning()) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    if (timer_.TaskCount() == 0U) {
      const uint64_t period_ms = std::min<uint64_t>(
          static_cast<uint64_t>(config_.sleep_time_s) * 1000U,
          std::numeric_limits<uint32_t>::max());
      auto added = timer_.Add(static_cast<uint32_t>(period_ms),
                              [this] { (void)RunOnce(WallNowSec()); });
      if (!added.has_value()) {
        return expected<void, TimerError>::error(added.get_error());
      }
    }
    return timer_.Start();
  }

  void Stop() { timer_.Stop(); }

  bool IsRunning() const noexcept { return timer_.IsRunning(); }

  uint32_t ScheduledTasks() const { return timer_.TaskCount(); }

  uint64_t TotalDeleted() const noexcept {
    return total_deleted_.load(std::memory_order_relaxed);
  }

 private:
  ObjectStore* BlobStoreFor(const std::string& collection) const noexcept {
    if (collection == "file") return filestore_;
    if (collection == "cached_file") return cachestore_;
    return nullptr;
  }

  expected<void, TaskGroupError> DeleteBlobs(const Collection& collection,
                                             const Query& due, ObjectStore& blobs,
                                             ExpiryReport& report) {
    std::atomic<uint64_t> removed{0U};
    TaskGroup group(config_.workers);
    for (const auto& doc : collection.Search(due)) {
      const std::string id = doc.id;
      group.Spawn([&blobs, &removed, id]() -> expected<void, std::string> {
        auto r = blobs.Delete(id);
        if (r.has_value() || r.get_error() == StoreError::kNotFound) {
          removed.fetch_add(1U, std::memory_order_relaxed);
          return expected<void, std::string>::success();
        }
        return expected<void, std::string>::error(id + ": " + ToString(r.get_error()));
      });
    }
    auto r = group.Wait();
    report.blobs_deleted[collection.Name()] = removed.load();
    if (!r.has_value()) {
      MWD_LOG_ERROR("Expiry", "    %u blob deletions failed in %s (first: %s), "
                    "records kept", group.FailedCount(),
                    collection.Name().c_str(), group.FirstError().c_str());
      return r;
    }
    MWD_LOG_INFO("Expiry", "    deleted associated files from the %s",
                 collection.Name() == "cached_file" ? "cachestore" : "filestore");
    return r;
  }

  ExpiryConfig config_;
  Datastore& datastore_;
  ObjectStore* filestore_;
  ObjectStore* cachestore_;
  PeriodicTimer timer_;
  std::atomic<uint64_t> total_deleted_{0U};
};

}  // namespace mwd

#endif  // MWD_EXPIRY_HPP_
