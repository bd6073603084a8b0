/**
 * @file record.hpp
 * @brief Records exchanged between the dispatcher, the workers and the
 *        document store, with their JSON document mapping.
 *
 * Every record maps to a nlohmann::json document through to_json/from_json
 * (found by ADL). Decoding a stored document goes through FromDocument(),
 * which turns nlohmann's type errors into StoreError::kInvalidRecord.
 */

#ifndef MWD_RECORD_HPP_
#define MWD_RECORD_HPP_

#include "mwd/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mwd {

// ============================================================================
// FileInfo
// ============================================================================

/** One file as declared by a submission or extracted by a service. */
struct FileInfo {
  std::string sha256;
  std::string type;
  std::string name;
};

inline bool operator==(const FileInfo& a, const FileInfo& b) {
  return a.sha256 == b.sha256 && a.type == b.type && a.name == b.name;
}

inline void to_json(nlohmann::json& j, const FileInfo& f) {
  j = nlohmann::json{{"sha256", f.sha256}, {"type", f.type}, {"name", f.name}};
}

inline void from_json(const nlohmann::json& j, FileInfo& f) {
  j.at("sha256").get_to(f.sha256);
  f.type = j.value("type", std::string());
  f.name = j.value("name", std::string());
}

// ============================================================================
// Submission
// ============================================================================

enum class SubmissionStatus : uint8_t {
  kIncomplete = 0,
  kComplete,
};

inline const char* ToString(SubmissionStatus s) noexcept {
  return s == SubmissionStatus::kComplete ? "complete" : "incomplete";
}

struct Submission {
  std::string sid;
  std::vector<std::string> selected_categories;
  std::vector<std::string> excluded_categories;
  std::vector<FileInfo> files;
  SubmissionStatus status = SubmissionStatus::kIncomplete;

  std::optional<int64_t> expiry_ts;
  bool archived = false;
  bool cancelled = false;

  std::vector<std::string> results;  ///< Result keys produced.
  std::vector<std::string> errors;   ///< Error keys (".e" suffix).

  /// Per-service parameter overrides: {"<service>": {...}}.
  nlohmann::json service_params = nlohmann::json::object();
};

inline void to_json(nlohmann::json& j, const Submission& s) {
  j = nlohmann::json{
      {"sid", s.sid},
      {"selected_categories", s.selected_categories},
      {"excluded_categories", s.excluded_categories},
      {"files", s.files},
      {"status", ToString(s.status)},
      {"archived", s.archived},
      {"cancelled", s.cancelled},
      {"results", s.results},
      {"errors", s.errors},
      {"service_params", s.service_params},
  };
  j["expiry_ts"] = s.expiry_ts.has_value() ? nlohmann::json(*s.expiry_ts)
                                           : nlohmann::json(nullptr);
}

inline void from_json(const nlohmann::json& j, Submission& s) {
  j.at("sid").get_to(s.sid);
  s.selected_categories =
      j.value("selected_categories", std::vector<std::string>());
  s.excluded_categories =
      j.value("excluded_categories", std::vector<std::string>());
  s.files = j.value("files", std::vector<FileInfo>());
  s.status = j.value("status", std::string("incomplete")) == "complete"
                 ? SubmissionStatus::kComplete
                 : SubmissionStatus::kIncomplete;
  s.archived = j.value("archived", false);
  s.cancelled = j.value("cancelled", false);
  s.results = j.value("results", std::vector<std::string>());
  s.errors = j.value("errors", std::vector<std::string>());
  s.service_params = j.value("service_params", nlohmann::json::object());
  auto it = j.find("expiry_ts");
  if (it != j.end() && it->is_number()) {
    s.expiry_ts = it->get<int64_t>();
  } else {
    s.expiry_ts.reset();
  }
}

// ============================================================================
// FileRecord
// ============================================================================

struct FileRecord {
  std::string sha256;
  std::string type;
  std::optional<int64_t> expiry_ts;
  bool archived = false;
};

inline void to_json(nlohmann::json& j, const FileRecord& f) {
  j = nlohmann::json{{"sha256", f.sha256}, {"type", f.type},
                     {"archived", f.archived}};
  j["expiry_ts"] = f.expiry_ts.has_value() ? nlohmann::json(*f.expiry_ts)
                                           : nlohmann::json(nullptr);
}

inline void from_json(const nlohmann::json& j, FileRecord& f) {
  j.at("sha256").get_to(f.sha256);
  f.type = j.value("type", std::string());
  f.archived = j.value("archived", false);
  auto it = j.find("expiry_ts");
  if (it != j.end() && it->is_number()) {
    f.expiry_ts = it->get<int64_t>();
  } else {
    f.expiry_ts.reset();
  }
}

// ============================================================================
// ServiceTask
// ============================================================================

/** One file assigned to one service within one submission. */
struct ServiceTask {
  std::string sid;
  std::string sha256;
  std::string file_type;
  std::string service_name;
  std::string config_hash;
  uint32_t attempt = 0U;  ///< 0 for the first delivery, N for the N-th retry.
  uint32_t depth = 0U;    ///< Extraction depth of the file.
};

inline void to_json(nlohmann::json& j, const ServiceTask& t) {
  j = nlohmann::json{{"sid", t.sid},
                     {"sha256", t.sha256},
                     {"file_type", t.file_type},
                     {"service_name", t.service_name},
                     {"config_hash", t.config_hash},
                     {"attempt", t.attempt},
                     {"depth", t.depth}};
}

inline void from_json(const nlohmann::json& j, ServiceTask& t) {
  j.at("sid").get_to(t.sid);
  j.at("sha256").get_to(t.sha256);
  j.at("service_name").get_to(t.service_name);
  t.file_type = j.value("file_type", std::string());
  t.config_hash = j.value("config_hash", std::string());
  t.attempt = j.value("attempt", 0U);
  t.depth = j.value("depth", 0U);
}

// ============================================================================
// ResultRecord / ErrorRecord
// ============================================================================

struct ResultRecord {
  std::string sha256;
  std::string service_name;
  std::string version = "0";
  std::string config_hash;
  nlohmann::json body = nlohmann::json::object();
  std::vector<FileInfo> extracted;
  std::vector<FileInfo> supplementary;
  std::optional<int64_t> expiry_ts;
};

inline void to_json(nlohmann::json& j, const ResultRecord& r) {
  j = nlohmann::json{{"sha256", r.sha256},
                     {"service_name", r.service_name},
                     {"version", r.version},
                     {"config_hash", r.config_hash},
                     {"body", r.body},
                     {"extracted", r.extracted},
                     {"supplementary", r.supplementary}};
  j["expiry_ts"] = r.expiry_ts.has_value() ? nlohmann::json(*r.expiry_ts)
                                           : nlohmann::json(nullptr);
}

inline void from_json(const nlohmann::json& j, ResultRecord& r) {
  r.sha256 = j.value("sha256", std::string());
  r.service_name = j.value("service_name", std::string());
  r.version = j.value("version", std::string("0"));
  r.config_hash = j.value("config_hash", std::string());
  r.body = j.value("body", nlohmann::json::object());
  r.extracted = j.value("extracted", std::vector<FileInfo>());
  r.supplementary = j.value("supplementary", std::vector<FileInfo>());
  auto it = j.find("expiry_ts");
  if (it != j.end() && it->is_number()) {
    r.expiry_ts = it->get<int64_t>();
  } else {
    r.expiry_ts.reset();
  }
}

enum class ErrorKind : uint8_t {
  kTerminal = 0,    ///< Failure limit exhausted.
  kExtraction,      ///< Extracted file could not be typed or scheduled.
  kConfiguration,   ///< Service definition unusable.
};

inline const char* ToString(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::kTerminal: return "terminal";
    case ErrorKind::kExtraction: return "extraction";
    case ErrorKind::kConfiguration: return "configuration";
  }
  return "unknown";
}

struct ErrorRecord {
  std::string sha256;
  std::string service_name;
  ErrorKind kind = ErrorKind::kTerminal;
  std::string message;
  uint32_t attempts = 0U;
  std::optional<int64_t> expiry_ts;
};

inline void to_json(nlohmann::json& j, const ErrorRecord& e) {
  j = nlohmann::json{{"sha256", e.sha256},
                     {"service_name", e.service_name},
                     {"kind", ToString(e.kind)},
                     {"message", e.message},
                     {"attempts", e.attempts}};
  j["expiry_ts"] = e.expiry_ts.has_value() ? nlohmann::json(*e.expiry_ts)
                                           : nlohmann::json(nullptr);
}

inline void from_json(const nlohmann::json& j, ErrorRecord& e) {
  e.sha256 = j.value("sha256", std::string());
  e.service_name = j.value("service_name", std::string());
  const std::string kind = j.value("kind", std::string("terminal"));
  e.kind = (kind == "extraction")      ? ErrorKind::kExtraction
           : (kind == "configuration") ? ErrorKind::kConfiguration
                                       : ErrorKind::kTerminal;
  e.message = j.value("message", std::string());
  e.attempts = j.value("attempts", 0U);
  auto it = j.find("expiry_ts");
  if (it != j.end() && it->is_number()) {
    e.expiry_ts = it->get<int64_t>();
  } else {
    e.expiry_ts.reset();
  }
}

// ============================================================================
// Keys
// ============================================================================

/// "<sha256>.<service>.v<version>.c<config_hash>"
inline std::string BuildResultKey(const std::string& sha256,
                                  const std::string& service_name,
                                  const std::string& version,
                                  const std::string& config_hash) {
  return sha256 + "." + service_name + ".v" + version + ".c" + config_hash;
}

inline std::string BuildErrorKey(const std::string& result_key) {
  return result_key + ".e";
}

/// Error key for the index-th extracted file of a result that could not be
/// registered.
inline std::string BuildExtractionErrorKey(const std::string& parent_result_key,
                                           size_t index) {
  return parent_result_key + ".x" + std::to_string(index) + ".e";
}

inline bool IsErrorKey(const std::string& key) noexcept {
  return key.size() >= 2 && key.compare(key.size() - 2, 2, ".e") == 0;
}

// ============================================================================
// Document decoding
// ============================================================================

template <typename T>
expected<T, StoreError> FromDocument(const nlohmann::json& doc) {
  try {
    return expected<T, StoreError>::success(doc.get<T>());
  } catch (const nlohmann::json::exception&) {
    return expected<T, StoreError>::error(StoreError::kInvalidRecord);
  }
}

}  // namespace mwd

#endif  // MWD_RECORD_HPP_
