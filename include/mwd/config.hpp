/**
 * @file config.hpp
 * @brief Multi-format configuration reader with template-based backend
 *        dispatch.
 *
 * Design patterns:
 *   - Tag dispatch: IniBackend / JsonBackend / YamlBackend type tags
 *   - Template specialization: ConfigParser<Backend> per-format parsers
 *   - Variadic templates: Config<Backends...> compile-time composition
 *
 * Supported backends (CMake opt-in):
 *   - IniBackend  : inih library       (MWD_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json       (MWD_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML             (MWD_CONFIG_YAML_ENABLED)
 *
 * All formats are flattened to a "section + key = value" model. Sequences
 * are joined with commas ("pre,core,post"); nested JSON objects below the
 * section level are kept as their JSON text so service configuration
 * documents survive the flattening.
 *
 * Usage:
 * @code
 *   mwd::MultiConfig cfg;
 *   cfg.LoadFile("dispatcher.ini");
 *   int32_t shards = cfg.GetInt("dispatcher", "shards", 2);
 * @endcode
 */

#ifndef MWD_CONFIG_HPP_
#define MWD_CONFIG_HPP_

#include "mwd/platform.hpp"
#include "mwd/vocabulary.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

#ifdef MWD_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef MWD_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef MWD_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace mwd {

// ============================================================================
// ConfigFormat
// ============================================================================

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

// ============================================================================
// Backend Tag Types (tag dispatch)
// ============================================================================

namespace detail {

inline bool CaseEqual(const std::string& a, const std::string& b) noexcept {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char la = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] + 32) : a[i];
    char lb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] + 32) : b[i];
    if (la != lb) return false;
  }
  return true;
}

inline std::string Trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) ++begin;
  while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) --end;
  return s.substr(begin, end - begin);
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const std::string& ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore - Flat key-value storage base
// ============================================================================

class ConfigStore {
 public:
  // --- Typed Getters ---

  std::string GetString(const std::string& section, const std::string& key,
                        const std::string& default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const std::string& section, const std::string& key,
                 int32_t default_val = 0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    return (end == e->value.c_str()) ? default_val : static_cast<int32_t>(val);
  }

  bool GetBool(const std::string& section, const std::string& key,
               bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? ParseBool(e->value) : default_val;
  }

  double GetDouble(const std::string& section, const std::string& key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str()) ? default_val : val;
  }

  /// Comma-separated list; blanks around items are trimmed, empties dropped.
  std::vector<std::string> GetList(const std::string& section,
                                   const std::string& key) const {
    std::vector<std::string> out;
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return out;
    std::stringstream ss(e->value);
    std::string item;
    while (std::getline(ss, item, ',')) {
      item = detail::Trim(item);
      if (!item.empty()) out.push_back(item);
    }
    return out;
  }

  // --- Optional Getters ---

  std::optional<int32_t> FindInt(const std::string& section,
                                 const std::string& key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    char* end = nullptr;
    long val = std::strtol(e->value.c_str(), &end, 10);
    if (end == e->value.c_str()) return std::nullopt;
    return static_cast<int32_t>(val);
  }

  std::optional<std::string> FindString(const std::string& section,
                                        const std::string& key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return std::nullopt;
    return e->value;
  }

  // --- Query ---

  bool HasSection(const std::string& section) const {
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section)) return true;
    }
    return false;
  }

  bool HasKey(const std::string& section, const std::string& key) const {
    return FindEntry(section, key) != nullptr;
  }

  /// Distinct section names, in first-seen order.
  std::vector<std::string> Sections() const {
    std::vector<std::string> out;
    for (const auto& e : entries_) {
      bool seen = false;
      for (const auto& s : out) {
        if (detail::CaseEqual(s, e.section)) {
          seen = true;
          break;
        }
      }
      if (!seen) out.push_back(e.section);
    }
    return out;
  }

  /// (key, value) pairs of one section, in insertion order.
  std::vector<std::pair<std::string, std::string>> SectionEntries(
      const std::string& section) const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section)) out.emplace_back(e.key, e.value);
    }
    return out;
  }

  uint32_t EntryCount() const noexcept {
    return static_cast<uint32_t>(entries_.size());
  }

  /// Programmatic override (tests, command-line flags).
  void Set(const std::string& section, const std::string& key,
           const std::string& value) {
    AddEntry(section, key, value);
  }

 protected:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  std::vector<Entry> entries_;

  void AddEntry(const std::string& section, const std::string& key,
                const std::string& value) {
    for (auto& e : entries_) {
      if (detail::CaseEqual(e.section, section) && detail::CaseEqual(e.key, key)) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

  static expected<std::string, ConfigError> ReadFile(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
      return expected<std::string, ConfigError>::error(ConfigError::kFileNotFound);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return expected<std::string, ConfigError>::success(buf.str());
  }

  const Entry* FindEntry(const std::string& section,
                         const std::string& key) const {
    for (const auto& e : entries_) {
      if (detail::CaseEqual(e.section, section) && detail::CaseEqual(e.key, key)) {
        return &e;
      }
    }
    return nullptr;
  }

  static bool ParseBool(const std::string& str) noexcept {
    return detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
           detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on");
  }

  static std::string GetExtension(const std::string& path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos ||
        (slash != std::string::npos && dot < slash)) {
      return std::string();
    }
    return path.substr(dot + 1);
  }

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend> - Template specialization per format
// ============================================================================

/** Default: format not supported (compile-time safe fallback). */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&,
                                                  const std::string&) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

// --- INI Backend ---

#ifdef MWD_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const std::string& path) {
    int result = ini_parse(path.c_str(), Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const std::string& data) {
    int result = ini_parse_string(data.c_str(), Handler, &store);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    s->AddEntry(section ? section : "", name ? name : "", value ? value : "");
    return 1;
  }
};
#endif

// --- JSON Backend ---

#ifdef MWD_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const std::string& path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const std::string& data) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          store.AddEntry(it.key(), kit.key(), ToStr(*kit));
        }
      } else {
        store.AddEntry("", it.key(), ToStr(*it));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const nlohmann::json& n) {
    if (n.is_string()) return n.get<std::string>();
    if (n.is_boolean()) return n.get<bool>() ? "true" : "false";
    if (n.is_number_integer()) return std::to_string(n.get<int64_t>());
    if (n.is_number_float()) {
      char b[64];
      std::snprintf(b, sizeof(b), "%g", n.get<double>());
      return b;
    }
    if (n.is_array()) {
      // Scalar arrays flatten to a list; anything deeper stays JSON.
      std::string joined;
      for (const auto& item : n) {
        if (item.is_structured()) return n.dump();
        if (!joined.empty()) joined += ",";
        joined += ToStr(item);
      }
      return joined;
    }
    return n.dump();
  }
};
#endif

// --- YAML Backend ---

#ifdef MWD_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const std::string& path) {
    auto r = ConfigStore::ReadFile(path);
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const std::string& data) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(data);
    } catch (const fkyaml::exception&) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;

      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          store.AddEntry(sec, key, ToStr(*kit));
        }
      } else {
        store.AddEntry("", sec, ToStr(node));
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string ToStr(const fkyaml::node& n) {
    if (n.is_string()) return n.get_value<std::string>();
    if (n.is_boolean()) return n.get_value<bool>() ? "true" : "false";
    if (n.is_integer()) return std::to_string(n.get_value<int64_t>());
    if (n.is_float_number()) {
      char b[64];
      std::snprintf(b, sizeof(b), "%g", n.get_value<double>());
      return b;
    }
    if (n.is_sequence()) {
      std::string joined;
      for (const auto& item : n) {
        if (!joined.empty()) joined += ",";
        joined += ToStr(item);
      }
      return joined;
    }
    return std::string();
  }
};
#endif

// ============================================================================
// Config<Backends...> - Compile-time composable config reader
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const std::string& path, ConfigFormat format = ConfigFormat::kAuto) {
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const std::string& data,
                                          ConfigFormat format) {
    return DispatchBuffer<Backends...>(data, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const std::string& path,
                                            ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const std::string& data,
                                              ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const std::string& path) const {
    const std::string ext = GetExtension(path);
    if (ext.empty()) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const std::string& ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  // First backend type (used as fallback format)
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

// ============================================================================
// Convenience Type Aliases
// ============================================================================

#if defined(MWD_CONFIG_INI_ENABLED) || defined(MWD_CONFIG_JSON_ENABLED) || \
    defined(MWD_CONFIG_YAML_ENABLED)
using MultiConfig = Config<
#ifdef MWD_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(MWD_CONFIG_INI_ENABLED) && \
    (defined(MWD_CONFIG_JSON_ENABLED) || defined(MWD_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef MWD_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(MWD_CONFIG_JSON_ENABLED) && defined(MWD_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef MWD_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef MWD_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef MWD_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef MWD_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace mwd

#endif  // MWD_CONFIG_HPP_
