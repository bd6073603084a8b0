/**
 * @file service_registry.hpp
 * @brief Validated, immutable view of the registered analysis services and
 *        the staleness-bounded cache that hands it to the scheduler.
 *
 * A ServiceRegistry is built once from a list of ServiceDefinitions and never
 * mutated afterwards. Definitions that name an unknown stage, carry a pattern
 * std::regex cannot compile or a non-positive failure limit are logged and
 * left out; they never fail the whole load.
 *
 * RegistryCache publishes the current registry as a shared_ptr snapshot.
 * Readers grab the pointer under a short lock and keep using it while a
 * refresh swaps in a new one.
 */

#ifndef MWD_SERVICE_REGISTRY_HPP_
#define MWD_SERVICE_REGISTRY_HPP_

#include "mwd/config.hpp"
#include "mwd/datastore.hpp"
#include "mwd/log.hpp"
#include "mwd/platform.hpp"
#include "mwd/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mwd {

// ============================================================================
// ServiceDefinition
// ============================================================================

struct ServiceDefinition {
  std::string name;
  std::string category;
  std::string stage;
  std::string accepts;   ///< Full-match pattern; empty matches nothing.
  std::string rejects;   ///< Optional full-match pattern.
  int32_t failure_limit = 5;
  std::string version = "0";
  uint32_t timeout_s = 60U;
  bool enabled = true;
  nlohmann::json config = nlohmann::json::object();
};

inline void to_json(nlohmann::json& j, const ServiceDefinition& d) {
  j = nlohmann::json{{"name", d.name},
                     {"category", d.category},
                     {"stage", d.stage},
                     {"accepts", d.accepts},
                     {"rejects", d.rejects},
                     {"failure_limit", d.failure_limit},
                     {"version", d.version},
                     {"timeout", d.timeout_s},
                     {"enabled", d.enabled},
                     {"config", d.config}};
}

inline void from_json(const nlohmann::json& j, ServiceDefinition& d) {
  j.at("name").get_to(d.name);
  d.category = j.value("category", std::string());
  d.stage = j.value("stage", std::string());
  d.accepts = j.value("accepts", std::string());
  auto rej = j.find("rejects");
  d.rejects = (rej != j.end() && rej->is_string()) ? rej->get<std::string>()
                                                   : std::string();
  d.failure_limit = j.value("failure_limit", 5);
  d.version = j.value("version", std::string("0"));
  d.timeout_s = j.value("timeout", 60U);
  d.enabled = j.value("enabled", true);
  d.config = j.value("config", nlohmann::json::object());
}

// ============================================================================
// Service
// ============================================================================

/** A definition that passed validation, with its patterns compiled. */
class Service final {
 public:
  Service(ServiceDefinition def, uint32_t stage_index, std::regex accept,
          std::optional<std::regex> reject)
      : def_(std::move(def)),
        stage_index_(stage_index),
        accept_(std::move(accept)),
        reject_(std::move(reject)) {}

  const std::string& Name() const noexcept { return def_.name; }
  const std::string& Category() const noexcept { return def_.category; }
  const std::string& Stage() const noexcept { return def_.stage; }
  uint32_t StageIndex() const noexcept { return stage_index_; }
  uint32_t FailureLimit() const noexcept {
    return static_cast<uint32_t>(def_.failure_limit);
  }
  const std::string& Version() const noexcept { return def_.version; }
  uint32_t TimeoutSec() const noexcept { return def_.timeout_s; }
  const nlohmann::json& Config() const noexcept { return def_.config; }
  const ServiceDefinition& Definition() const noexcept { return def_; }

  /// accept full-matches and reject (if any) does not.
  bool Accepts(const std::string& file_type) const {
    if (def_.accepts.empty()) return false;
    if (!std::regex_match(file_type, accept_)) return false;
    return !(reject_.has_value() && std::regex_match(file_type, *reject_));
  }

 private:
  ServiceDefinition def_;
  uint32_t stage_index_;
  std::regex accept_;
  std::optional<std::regex> reject_;
};

using ServicePtr = std::shared_ptr<const Service>;
using CategoryMap = std::map<std::string, std::set<std::string>>;

namespace detail {

inline std::optional<std::regex> CompilePattern(const std::string& pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    MWD_LOG_DEBUG("Registry", "regex '%s': %s", pattern.c_str(), e.what());
    return std::nullopt;
  }
}

}  // namespace detail

// ============================================================================
// ServiceRegistry
// ============================================================================

struct RejectedService {
  std::string name;
  RegistryError reason;
};

class ServiceRegistry final {
 public:
  ServiceRegistry() = default;

  /**
   * @brief Validate definitions against the stage list and build a registry.
   *
   * @param stages            Ordered stage names; must not be empty.
   * @param defs              Candidate definitions. Disabled ones are ignored.
   * @param extra_categories  Configured categories of categories, merged
   *                          with the category of every loaded service.
   * @return The registry (possibly with rejected definitions), or
   *         kEmptyStageList.
   */
  static expected<ServiceRegistry, RegistryError> Load(
      const std::vector<std::string>& stages,
      const std::vector<ServiceDefinition>& defs,
      const std::map<std::string, std::vector<std::string>>& extra_categories =
          {}) {
    using R = expected<ServiceRegistry, RegistryError>;
    if (stages.empty()) {
      MWD_LOG_ERROR("Registry", "stage list is empty");
      return R::error(RegistryError::kEmptyStageList);
    }

    ServiceRegistry reg;
    reg.stages_ = stages;

    for (const auto& def : defs) {
      if (!def.enabled) continue;
      auto reason = reg.Validate(def);
      if (reason.has_value()) {
        MWD_LOG_WARN("Registry", "service '%s' rejected: %s", def.name.c_str(),
                     ToString(*reason));
        reg.rejected_.push_back(RejectedService{def.name, *reason});
        continue;
      }
      const auto stage_it = std::find(stages.begin(), stages.end(), def.stage);
      const auto stage_index =
          static_cast<uint32_t>(std::distance(stages.begin(), stage_it));
      auto accept = detail::CompilePattern(def.accepts);
      std::optional<std::regex> reject;
      if (!def.rejects.empty()) reject = detail::CompilePattern(def.rejects);

      reg.services_.emplace(
          def.name, std::make_shared<Service>(def, stage_index,
                                              std::move(*accept),
                                              std::move(reject)));
      if (!def.category.empty()) reg.categories_[def.category].insert(def.name);
    }

    for (const auto& kv : extra_categories) {
      auto& members = reg.categories_[kv.first];
      members.insert(kv.second.begin(), kv.second.end());
    }

    MWD_LOG_INFO("Registry", "loaded %zu services (%zu rejected), %zu categories",
                 reg.services_.size(), reg.rejected_.size(),
                 reg.categories_.size());
    return R::success(std::move(reg));
  }

  ServicePtr Find(const std::string& name) const {
    auto it = services_.find(name);
    return it == services_.end() ? nullptr : it->second;
  }

  const std::map<std::string, ServicePtr>& Services() const noexcept {
    return services_;
  }
  const CategoryMap& Categories() const noexcept { return categories_; }
  const std::vector<std::string>& Stages() const noexcept { return stages_; }
  const std::vector<RejectedService>& Rejected() const noexcept {
    return rejected_;
  }
  size_t Size() const noexcept { return services_.size(); }

 private:
  std::optional<RegistryError> Validate(const ServiceDefinition& def) const {
    if (services_.count(def.name) != 0U) return RegistryError::kDuplicateService;
    if (std::find(stages_.begin(), stages_.end(), def.stage) == stages_.end()) {
      return RegistryError::kUnknownStage;
    }
    if (def.failure_limit <= 0) return RegistryError::kInvalidLimit;
    if (!detail::CompilePattern(def.accepts).has_value()) {
      return RegistryError::kInvalidPattern;
    }
    if (!def.rejects.empty() && !detail::CompilePattern(def.rejects).has_value()) {
      return RegistryError::kInvalidPattern;
    }
    return std::nullopt;
  }

  std::vector<std::string> stages_;
  std::map<std::string, ServicePtr> services_;
  CategoryMap categories_;
  std::vector<RejectedService> rejected_;
};

// ============================================================================
// Definition sources
// ============================================================================

/**
 * @brief Read every "[service.<name>]" section of a config file.
 *
 * Keys: category, stage, accepts, rejects, failure_limit, version, timeout,
 * enabled, config (a JSON object as text). A section whose config text is
 * not a JSON object is logged and skipped.
 */
inline std::vector<ServiceDefinition> ServiceDefinitionsFromConfig(
    const ConfigStore& store) {
  static const std::string kPrefix = "service.";
  std::vector<ServiceDefinition> out;
  for (const auto& section : store.Sections()) {
    if (section.size() <= kPrefix.size() ||
        !detail::CaseEqual(section.substr(0, kPrefix.size()), kPrefix)) {
      continue;
    }
    ServiceDefinition def;
    def.name = section.substr(kPrefix.size());
    def.category = store.GetString(section, "category");
    def.stage = store.GetString(section, "stage");
    def.accepts = store.GetString(section, "accepts");
    def.rejects = store.GetString(section, "rejects");
    def.failure_limit = store.GetInt(section, "failure_limit", 5);
    def.version = store.GetString(section, "version", "0");
    def.timeout_s = static_cast<uint32_t>(
        std::max<int32_t>(0, store.GetInt(section, "timeout", 60)));
    def.enabled = store.GetBool(section, "enabled", true);

    const std::string raw = store.GetString(section, "config", "{}");
    auto parsed = nlohmann::json::parse(raw, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
      MWD_LOG_WARN("Registry", "[%s] config is not a JSON object, skipped",
                   section.c_str());
      continue;
    }
    def.config = std::move(parsed);
    out.push_back(std::move(def));
  }
  return out;
}

/** Read every document of the service collection; undecodable ones are skipped. */
inline std::vector<ServiceDefinition> ServiceDefinitionsFromCollection(
    const Collection& services) {
  std::vector<ServiceDefinition> out;
  for (const auto& doc : services.Search(Query::All())) {
    auto def = FromDocument<ServiceDefinition>(doc.body);
    if (!def.has_value()) {
      MWD_LOG_WARN("Registry", "service document '%s' undecodable: %s",
                   doc.id.c_str(), ToString(def.get_error()));
      continue;
    }
    out.push_back(std::move(def).value());
  }
  return out;
}

// ============================================================================
// RegistryCache
// ============================================================================

/**
 * @brief Shared registry snapshot with an explicit staleness window.
 *
 * RefreshIfStale() is called at the start of each scheduling decision and by
 * the server timer; Reload() forces a rebuild. A failed rebuild keeps the
 * previous snapshot.
 */
class RegistryCache final {
 public:
  using Source = std::function<expected<ServiceRegistry, RegistryError>()>;

  RegistryCache(Source source, uint32_t refresh_ms)
      : source_(std::move(source)),
        refresh_ms_(refresh_ms),
        snapshot_(std::make_shared<ServiceRegistry>()) {}

  RegistryCache(const RegistryCache&) = delete;
  RegistryCache& operator=(const RegistryCache&) = delete;

  std::shared_ptr<const ServiceRegistry> Get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
  }

  /// Steady-clock ms of the last successful load, 0 before the first one.
  uint64_t LastRefreshed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_refreshed_ms_;
  }

  /// @return true when a reload was attempted.
  bool RefreshIfStale(uint64_t now_ms) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (loaded_ && now_ms - last_refreshed_ms_ < refresh_ms_) return false;
    }
    std::lock_guard<std::mutex> reload_lock(reload_mutex_);
    {
      // Another thread may have refreshed while we waited.
      std::lock_guard<std::mutex> lock(mutex_);
      if (loaded_ && now_ms - last_refreshed_ms_ < refresh_ms_) return false;
    }
    (void)ReloadAt(now_ms);
    return true;
  }

  expected<void, RegistryError> Reload() { return ReloadAt(SteadyNowMs()); }

  uint64_t ReloadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reload_count_;
  }

 private:
  expected<void, RegistryError> ReloadAt(uint64_t now_ms) {
    auto reg = source_();
    std::lock_guard<std::mutex> lock(mutex_);
    ++reload_count_;
    if (!reg.has_value()) {
      MWD_LOG_WARN("Registry", "reload failed (%s), keeping previous snapshot",
                   ToString(reg.get_error()));
      // Retry only after another window.
      last_refreshed_ms_ = now_ms;
      loaded_ = true;
      return expected<void, RegistryError>::error(reg.get_error());
    }
    snapshot_ = std::make_shared<ServiceRegistry>(std::move(reg).value());
    last_refreshed_ms_ = now_ms;
    loaded_ = true;
    return expected<void, RegistryError>::success();
  }

  Source source_;
  uint32_t refresh_ms_;
  mutable std::mutex mutex_;
  std::mutex reload_mutex_;
  std::shared_ptr<const ServiceRegistry> snapshot_;
  uint64_t last_refreshed_ms_ = 0U;
  uint64_t reload_count_ = 0U;
  bool loaded_ = false;
};

/// Source that rebuilds the registry from the service collection.
inline RegistryCache::Source CollectionRegistrySource(
    std::shared_ptr<Collection> services, std::vector<std::string> stages,
    std::map<std::string, std::vector<std::string>> extra_categories = {}) {
  return [services = std::move(services), stages = std::move(stages),
          extra = std::move(extra_categories)]() {
    return ServiceRegistry::Load(stages, ServiceDefinitionsFromCollection(*services),
                                 extra);
  };
}

/// Source that serves a fixed definition list.
inline RegistryCache::Source StaticRegistrySource(
    std::vector<ServiceDefinition> defs, std::vector<std::string> stages,
    std::map<std::string, std::vector<std::string>> extra_categories = {}) {
  return [defs = std::move(defs), stages = std::move(stages),
          extra = std::move(extra_categories)]() {
    return ServiceRegistry::Load(stages, defs, extra);
  };
}

}  // namespace mwd

#endif  // MWD_SERVICE_REGISTRY_HPP_
