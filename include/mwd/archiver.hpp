/**
 * @file archiver.hpp
 * @brief Moves a submission with its files and results into the archive.
 *
 * Consumes [type, id, delete_after] messages from the archive queue. Only
 * the "submission" type exists. The submission is copied into the archive
 * collection with its expiry cleared; then every related file record (and
 * blob, when the archive store is a different store) and every non-error
 * result is copied too. delete_after removes the live copies.
 */

#ifndef MWD_ARCHIVER_HPP_
#define MWD_ARCHIVER_HPP_

#include "mwd/datastore.hpp"
#include "mwd/dispatch_config.hpp"
#include "mwd/filestore.hpp"
#include "mwd/log.hpp"
#include "mwd/record.hpp"
#include "mwd/task_queue.hpp"
#include "mwd/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <thread>

namespace mwd {

enum class ArchiveOutcome : uint8_t {
  kIdle = 0,      ///< Nothing queued within the poll timeout.
  kArchived,
  kNotFound,
  kInvalidType,
  kMalformed,
  kFailed,        ///< Store error while archiving.
};

inline const char* ToString(ArchiveOutcome o) noexcept {
  switch (o) {
    case ArchiveOutcome::kIdle: return "idle";
    case ArchiveOutcome::kArchived: return "archived";
    case ArchiveOutcome::kNotFound: return "not_found";
    case ArchiveOutcome::kInvalidType: return "invalid";
    case ArchiveOutcome::kMalformed: return "malformed";
    case ArchiveOutcome::kFailed: return "exception";
  }
  return "unknown";
}

struct ArchiveStats {
  uint64_t received = 0U;
  uint64_t submission = 0U;
  uint64_t file = 0U;
  uint64_t result = 0U;
  uint64_t invalid = 0U;
  uint64_t not_found = 0U;
  uint64_t malformed = 0U;
  uint64_t failed = 0U;
};

/// Message as pushed onto the archive queue.
inline nlohmann::json MakeArchiveMessage(const std::string& type,
                                         const std::string& id,
                                         bool delete_after) {
  return nlohmann::json::array({type, id, delete_after});
}

class Archiver final {
 public:
  Archiver(const ArchiveConfig& config, Datastore& datastore,
           ObjectStore& filestore, ObjectStore& archivestore,
           NamedQueue<nlohmann::json>& queue)
      : config_(config),
        datastore_(datastore),
        filestore_(filestore),
        archivestore_(archivestore),
        queue_(queue) {}

  ~Archiver() { Stop(); }

  Archiver(const Archiver&) = delete;
  Archiver& operator=(const Archiver&) = delete;

  /// Pop and process at most one message.
  ArchiveOutcome RunOnce() {
    auto msg = queue_.Pop(config_.poll_timeout_ms);
    if (!msg.has_value()) return ArchiveOutcome::kIdle;
    return Process(*msg);
  }

  ArchiveOutcome Process(const nlohmann::json& msg) {
    if (!msg.is_array() || msg.size() != 3U || !msg[0].is_string() ||
        !msg[1].is_string() || !msg[2].is_boolean()) {
      MWD_LOG_ERROR("Archiver", "invalid message received: %s", msg.dump().c_str());
      Count(&ArchiveStats::malformed);
      return ArchiveOutcome::kMalformed;
    }
    Count(&ArchiveStats::received);
    const std::string type = msg[0].get<std::string>();
    const std::string id = msg[1].get<std::string>();
    const bool delete_after = msg[2].get<bool>();

    if (type != "submission") {
      Count(&ArchiveStats::invalid);
      MWD_LOG_WARN("Archiver", "'%s' is not a valid archive type", type.c_str());
      return ArchiveOutcome::kInvalidType;
    }
    Count(&ArchiveStats::submission);
    return ArchiveSubmission(id, delete_after);
  }

  void Start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) return;
    thread_ = std::thread([this] {
      while (running_.load(std::memory_order_acquire)) (void)RunOnce();
    });
  }

  void Stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) thread_.join();
  }

  ArchiveStats Stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
  }

 private:
  ArchiveOutcome ArchiveSubmission(const std::string& sid, bool delete_after) {
    Submission submission;
    auto archived = LoadRecord<Submission>(*datastore_.submission_archive, sid);
    if (archived.has_value()) {
      submission = std::move(archived).value();
      if (delete_after) (void)datastore_.submission->Delete(sid);
    } else {
      auto live = LoadRecord<Submission>(*datastore_.submission, sid);
      if (!live.has_value()) {
        Count(&ArchiveStats::not_found);
        MWD_LOG_WARN("Archiver", "could not archive submission '%s': %s",
                     sid.c_str(), ToString(live.get_error()));
        return ArchiveOutcome::kNotFound;
      }
      submission = std::move(live).value();
      submission.expiry_ts.reset();
      submission.archived = true;
      if (!SaveRecord(*datastore_.submission_archive, sid, submission).has_value()) {
        Count(&ArchiveStats::failed);
        return ArchiveOutcome::kFailed;
      }
      auto updated = delete_after ? datastore_.submission->Delete(sid)
                                  : SaveRecord(*datastore_.submission, sid, submission);
      if (!updated.has_value()) {
        MWD_LOG_WARN("Archiver", "live submission '%s' not updated: %s",
                     sid.c_str(), ToString(updated.get_error()));
      }
    }

    std::set<std::string> files;
    for (const auto& f : submission.files) files.insert(f.sha256);
    for (const auto& key : submission.results) {
      if (IsErrorKey(key)) continue;
      auto result = LoadRecord<ResultRecord>(*datastore_.result, key);
      if (!result.has_value()) continue;
      for (const auto& f : result.value().extracted) files.insert(f.sha256);
      for (const auto& f : result.value().supplementary) files.insert(f.sha256);
    }

    bool ok = true;
    for (const auto& sha : files) {
      if (sha.empty()) continue;
      Count(&ArchiveStats::file);
      ok = ArchiveDocument(*datastore_.file, *datastore_.file_archive, sha,
                           delete_after) && ok;
      if (&filestore_ != &archivestore_) CopyBlob(sha);
    }

    for (const auto& key : submission.results) {
      if (IsErrorKey(key)) continue;
      Count(&ArchiveStats::result);
      ok = ArchiveDocument(*datastore_.result, *datastore_.result_archive, key,
                           delete_after) && ok;
    }

    if (!ok) {
      Count(&ArchiveStats::failed);
      MWD_LOG_ERROR("Archiver", "submission '%s' archived with store errors",
                    sid.c_str());
      return ArchiveOutcome::kFailed;
    }
    MWD_LOG_INFO("Archiver", "successfully archived submission '%s'", sid.c_str());
    return ArchiveOutcome::kArchived;
  }

  /// Copy one document into its archive collection with expiry cleared.
  /// A document missing from the live collection is not an error.
  bool ArchiveDocument(Collection& live, Collection& archive, const std::string& id,
                       bool delete_after) {
    auto doc = live.Get(id);
    if (!doc.has_value()) {
      MWD_LOG_DEBUG("Archiver", "%s/%s not in live collection", live.Name().c_str(),
                    id.c_str());
      return doc.get_error() == StoreError::kNotFound;
    }
    nlohmann::json body = doc.value();
    body["expiry_ts"] = nullptr;
    body["archived"] = true;
    if (!archive.Save(id, body).has_value()) {
      MWD_LOG_ERROR("Archiver", "could not save %s/%s", archive.Name().c_str(),
                    id.c_str());
      return false;
    }
    if (delete_after) (void)live.Delete(id);
    return true;
  }

  void CopyBlob(const std::string& sha) {
    std::error_code ec;
    const auto tmp_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
      MWD_LOG_ERROR("Archiver", "no temp directory: %s", ec.message().c_str());
      return;
    }
    const std::string staged = (tmp_dir / ("mwd-archive-" + sha)).string();
    MWD_SCOPE_EXIT(std::filesystem::remove(staged, ec));

    auto dl = filestore_.Download(sha, staged);
    if (!dl.has_value()) {
      MWD_LOG_ERROR("Archiver", "could not copy file %s from the filestore (%s)",
                    sha.c_str(), ToString(dl.get_error()));
      return;
    }
    if (std::filesystem::file_size(staged, ec) == 0U || ec) return;
    auto up = archivestore_.Upload(staged, sha);
    if (!up.has_value()) {
      MWD_LOG_ERROR("Archiver", "could not copy file %s to the archivestore (%s)",
                    sha.c_str(), ToString(up.get_error()));
    }
  }

  void Count(uint64_t ArchiveStats::*field) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++(stats_.*field);
  }

  ArchiveConfig config_;
  Datastore& datastore_;
  ObjectStore& filestore_;
  ObjectStore& archivestore_;
  NamedQueue<nlohmann::json>& queue_;

  mutable std::mutex stats_mutex_;
  ArchiveStats stats_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace mwd

#endif  // MWD_ARCHIVER_HPP_
