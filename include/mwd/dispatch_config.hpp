/**
 * @file dispatch_config.hpp
 * @brief Typed, immutable dispatcher configuration built from a ConfigStore.
 *
 * Loaded once at process start and passed by value (or const reference)
 * into the Scheduler, Dispatcher, DispatchServer and sweep jobs. Nothing
 * in the library reads configuration through a global.
 *
 * Recognized sections:
 * @code
 *   [core]        stages = pre,core,post   system_category = system
 *                 registry_refresh_ms = 5000   max_extraction_depth = 6
 *                 log_level = info
 *   [dispatcher]  shards = 2   poll_timeout_ms = 250   timer_period_ms = 100
 *   [retry]       base_ms = 500   max_ms = 30000   jitter_ms = 250
 *   [expiry]      delay_hours = 0   batch_delete = false
 *                 delete_storage = true   workers = 4   sleep_time_s = 60
 *   [archive]     queue = m-archive   poll_timeout_ms = 1000
 *   [categories]  <category> = member,member,...
 * @endcode
 */

#ifndef MWD_DISPATCH_CONFIG_HPP_
#define MWD_DISPATCH_CONFIG_HPP_

#include "mwd/config.hpp"
#include "mwd/log.hpp"
#include "mwd/vocabulary.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mwd {

/** Bounded, jittered exponential backoff between service task retries. */
struct RetryPolicyConfig {
  uint32_t base_ms = 500U;
  uint32_t max_ms = 30000U;
  uint32_t jitter_ms = 250U;
};

struct ExpiryConfig {
  uint32_t delay_hours = 0U;
  bool batch_delete = false;   ///< Round the deadline down to the day.
  bool delete_storage = true;  ///< Also delete associated blobs.
  uint32_t workers = 4U;
  uint32_t sleep_time_s = 60U;
};

struct ArchiveConfig {
  std::string queue = "m-archive";
  uint32_t poll_timeout_ms = 1000U;
};

struct DispatchConfig {
  std::vector<std::string> stages{"pre", "core", "post"};
  std::string system_category = "system";
  uint32_t registry_refresh_ms = 5000U;
  uint32_t max_extraction_depth = 6U;

  uint32_t shards = 2U;
  uint32_t poll_timeout_ms = 250U;
  uint32_t timer_period_ms = 100U;

  /// Explicit categories of categories, merged with service categories.
  std::map<std::string, std::vector<std::string>> categories;

  log::Level log_level = log::Level::kInfo;

  RetryPolicyConfig retry;
  ExpiryConfig expiry;
  ArchiveConfig archive;
};

namespace detail {

inline expected<uint32_t, ConfigError> ReadPositive(const ConfigStore& store,
                                                    const char* section,
                                                    const char* key,
                                                    uint32_t fallback,
                                                    bool allow_zero) {
  auto v = store.FindInt(section, key);
  if (!v.has_value()) {
    if (store.HasKey(section, key)) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<uint32_t, ConfigError>::success(fallback);
  }
  if (*v < 0 || (*v == 0 && !allow_zero)) {
    MWD_LOG_ERROR("Config", "[%s] %s must be %s, got %d", section, key,
                  allow_zero ? "non-negative" : "positive", *v);
    return expected<uint32_t, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(*v));
}

}  // namespace detail

/**
 * @brief Build a DispatchConfig from a parsed store.
 *
 * Missing keys keep their defaults. A present but malformed numeric value,
 * or an empty stage list, is a configuration error.
 */
inline expected<DispatchConfig, ConfigError> LoadDispatchConfig(
    const ConfigStore& store) {
  using R = expected<DispatchConfig, ConfigError>;
  DispatchConfig cfg;

  if (store.HasKey("core", "stages")) {
    cfg.stages = store.GetList("core", "stages");
    if (cfg.stages.empty()) {
      MWD_LOG_ERROR("Config", "[core] stages is empty");
      return R::error(ConfigError::kInvalidValue);
    }
  }
  cfg.system_category = store.GetString("core", "system_category",
                                        cfg.system_category);
  cfg.log_level = log::ParseLevel(
      store.GetString("core", "log_level", "info").c_str(), log::Level::kInfo);

  struct Field {
    const char* section;
    const char* key;
    uint32_t* target;
    bool allow_zero;
  };
  const Field fields[] = {
      {"core", "registry_refresh_ms", &cfg.registry_refresh_ms, true},
      {"core", "max_extraction_depth", &cfg.max_extraction_depth, true},
      {"dispatcher", "shards", &cfg.shards, false},
      {"dispatcher", "poll_timeout_ms", &cfg.poll_timeout_ms, false},
      {"dispatcher", "timer_period_ms", &cfg.timer_period_ms, false},
      {"retry", "base_ms", &cfg.retry.base_ms, true},
      {"retry", "max_ms", &cfg.retry.max_ms, true},
      {"retry", "jitter_ms", &cfg.retry.jitter_ms, true},
      {"expiry", "delay_hours", &cfg.expiry.delay_hours, true},
      {"expiry", "workers", &cfg.expiry.workers, false},
      {"expiry", "sleep_time_s", &cfg.expiry.sleep_time_s, false},
      {"archive", "poll_timeout_ms", &cfg.archive.poll_timeout_ms, false},
  };
  for (const auto& f : fields) {
    auto v = detail::ReadPositive(store, f.section, f.key, *f.target,
                                  f.allow_zero);
    if (!v.has_value()) return R::error(v.get_error());
    *f.target = v.value();
  }

  cfg.expiry.batch_delete = store.GetBool("expiry", "batch_delete",
                                          cfg.expiry.batch_delete);
  cfg.expiry.delete_storage = store.GetBool("expiry", "delete_storage",
                                            cfg.expiry.delete_storage);
  cfg.archive.queue = store.GetString("archive", "queue", cfg.archive.queue);

  for (const auto& kv : store.SectionEntries("categories")) {
    std::vector<std::string> members;
    std::stringstream ss(kv.second);
    std::string item;
    while (std::getline(ss, item, ',')) {
      item = detail::Trim(item);
      if (!item.empty()) members.push_back(item);
    }
    cfg.categories[kv.first] = members;
  }

  return R::success(std::move(cfg));
}

}  // namespace mwd

#endif  // MWD_DISPATCH_CONFIG_HPP_
