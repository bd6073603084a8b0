/**
 * @file scheduler.hpp
 * @brief Per (submission, file type) stage plan.
 *
 * The scheduler is stateless apart from the registry cache it reads: every
 * call takes one registry snapshot (refreshing it first when stale), resolves
 * the submission's selectors and filters the candidates by file type.
 */

#ifndef MWD_SCHEDULER_HPP_
#define MWD_SCHEDULER_HPP_

#include "mwd/category.hpp"
#include "mwd/dispatch_config.hpp"
#include "mwd/log.hpp"
#include "mwd/platform.hpp"
#include "mwd/record.hpp"
#include "mwd/service_registry.hpp"
#include "mwd/vocabulary.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace mwd {

/** One bucket per stage, in stage order; empty buckets are kept. */
struct Schedule {
  std::vector<std::string> stage_names;
  std::vector<std::map<std::string, ServicePtr>> buckets;

  size_t ServiceCount() const noexcept {
    size_t n = 0U;
    for (const auto& b : buckets) n += b.size();
    return n;
  }

  bool Empty() const noexcept { return ServiceCount() == 0U; }
};

struct ScheduleReport {
  Schedule schedule;
  std::vector<std::string> skipped;  ///< Candidates left out, sorted.
};

class Scheduler final {
 public:
  Scheduler(const DispatchConfig& config, RegistryCache& cache)
      : stages_(config.stages),
        system_category_(config.system_category),
        cache_(cache) {}

  Schedule BuildSchedule(const Submission& submission,
                         const std::string& file_type) {
    return BuildScheduleWithReport(submission, file_type).schedule;
  }

  ScheduleReport BuildScheduleWithReport(const Submission& submission,
                                         const std::string& file_type) {
    cache_.RefreshIfStale(SteadyNowMs());
    const auto registry = cache_.Get();
    const auto& services = registry->Services();
    const auto& categories = registry->Categories();

    std::set<std::string> selected;
    if (!submission.selected_categories.empty()) {
      selected = ExpandCategories(submission.selected_categories, categories);
    } else {
      for (const auto& kv : services) selected.insert(kv.first);
    }
    const std::set<std::string> excluded =
        ExpandCategories(submission.excluded_categories, categories);

    std::set<std::string> candidates;
    for (const auto& name : selected) {
      if (excluded.count(name) == 0U) candidates.insert(name);
    }
    for (const auto& kv : services) {
      if (kv.second->Category() == system_category_) candidates.insert(kv.first);
    }

    ScheduleReport report;
    report.schedule.stage_names = stages_;
    report.schedule.buckets.resize(stages_.size());

    for (const auto& name : candidates) {
      auto it = services.find(name);
      if (it == services.end()) {
        MWD_LOG_WARN("Scheduler", "%s: service '%s' is not registered",
                     submission.sid.c_str(), name.c_str());
        report.skipped.push_back(name);
        continue;
      }
      const ServicePtr& svc = it->second;
      if (!svc->Accepts(file_type)) {
        report.skipped.push_back(name);
        continue;
      }
      auto idx = StageIndex(svc->Stage());
      if (!idx.has_value()) {
        MWD_LOG_WARN("Scheduler", "service '%s' stage '%s' not in stage list",
                     name.c_str(), svc->Stage().c_str());
        report.skipped.push_back(name);
        continue;
      }
      report.schedule.buckets[idx.value()].emplace(name, svc);
    }

    MWD_LOG_DEBUG("Scheduler", "%s type=%s: %zu scheduled, %zu skipped",
                  submission.sid.c_str(), file_type.c_str(),
                  report.schedule.ServiceCount(), report.skipped.size());
    return report;
  }

  expected<uint32_t, RegistryError> StageIndex(const std::string& stage) const {
    auto it = std::find(stages_.begin(), stages_.end(), stage);
    if (it == stages_.end()) {
      return expected<uint32_t, RegistryError>::error(RegistryError::kUnknownStage);
    }
    return expected<uint32_t, RegistryError>::success(
        static_cast<uint32_t>(std::distance(stages_.begin(), it)));
  }

  const std::vector<std::string>& Stages() const noexcept { return stages_; }

  CategoryMap Categories() const { return cache_.Get()->Categories(); }

  std::shared_ptr<const ServiceRegistry> Registry() const { return cache_.Get(); }

  /// Result key for a registered service; its version comes from the registry.
  expected<std::string, RegistryError> BuildResultKey(
      const std::string& sha256, const std::string& service_name,
      const std::string& config_hash) const {
    auto svc = cache_.Get()->Find(service_name);
    if (svc == nullptr) {
      return expected<std::string, RegistryError>::error(RegistryError::kNotFound);
    }
    return expected<std::string, RegistryError>::success(
        mwd::BuildResultKey(sha256, service_name, svc->Version(), config_hash));
  }

 private:
  std::vector<std::string> stages_;
  std::string system_category_;
  RegistryCache& cache_;
};

}  // namespace mwd

#endif  // MWD_SCHEDULER_HPP_
