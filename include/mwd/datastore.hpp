/**
 * @file datastore.hpp
 * @brief Document store collaborator: collection interface, filter queries
 *        and the thread-safe in-process implementation.
 *
 * The dispatcher only needs get / save / search / delete-matching over a
 * handful of collections, with equality and numeric range filters on named
 * top-level fields plus match-all. Anything richer belongs to the real
 * backend behind the Collection interface.
 */

#ifndef MWD_DATASTORE_HPP_
#define MWD_DATASTORE_HPP_

#include "mwd/log.hpp"
#include "mwd/record.hpp"
#include "mwd/vocabulary.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mwd {

// ============================================================================
// Query
// ============================================================================

/**
 * @brief Conjunction of field filters; no filter means match-all ("*").
 *
 * A range filter only matches numeric fields, so records whose field is
 * absent or null (e.g. no expiry_ts) never fall inside a range.
 */
class Query {
 public:
  static Query All() { return Query(); }

  Query& Equals(std::string field, nlohmann::json value) {
    filters_.push_back(Filter{std::move(field), std::move(value),
                              std::nullopt, std::nullopt, false});
    return *this;
  }

  /// Inclusive numeric range; an absent bound is open.
  Query& Range(std::string field, std::optional<double> lo,
               std::optional<double> hi) {
    filters_.push_back(Filter{std::move(field), nullptr, lo, hi, true});
    return *this;
  }

  bool IsMatchAll() const noexcept { return filters_.empty(); }

  bool Matches(const nlohmann::json& doc) const {
    for (const auto& f : filters_) {
      auto it = doc.find(f.field);
      if (it == doc.end()) return false;
      if (f.is_range) {
        if (!it->is_number()) return false;
        const double v = it->get<double>();
        if (f.lo.has_value() && v < *f.lo) return false;
        if (f.hi.has_value() && v > *f.hi) return false;
      } else if (*it != f.value) {
        return false;
      }
    }
    return true;
  }

 private:
  struct Filter {
    std::string field;
    nlohmann::json value;
    std::optional<double> lo;
    std::optional<double> hi;
    bool is_range;
  };

  std::vector<Filter> filters_;
};

// ============================================================================
// Collection
// ============================================================================

struct Document {
  std::string id;
  nlohmann::json body;
};

class Collection {
 public:
  virtual ~Collection() = default;

  virtual const std::string& Name() const noexcept = 0;

  virtual expected<nlohmann::json, StoreError> Get(const std::string& id) const = 0;
  virtual expected<void, StoreError> Save(const std::string& id,
                                          const nlohmann::json& doc) = 0;
  virtual expected<void, StoreError> Delete(const std::string& id) = 0;
  virtual bool Exists(const std::string& id) const = 0;

  virtual std::vector<Document> Search(const Query& query) const = 0;
  virtual uint64_t Count(const Query& query) const = 0;
  virtual uint64_t DeleteMatching(const Query& query) = 0;
};

/** Thread-safe map-backed collection. */
class MemoryCollection final : public Collection {
 public:
  explicit MemoryCollection(std::string name) : name_(std::move(name)) {}

  const std::string& Name() const noexcept override { return name_; }

  expected<nlohmann::json, StoreError> Get(const std::string& id) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = docs_.find(id);
    if (it == docs_.end()) {
      return expected<nlohmann::json, StoreError>::error(StoreError::kNotFound);
    }
    return expected<nlohmann::json, StoreError>::success(it->second);
  }

  expected<void, StoreError> Save(const std::string& id,
                                  const nlohmann::json& doc) override {
    if (!doc.is_object()) {
      return expected<void, StoreError>::error(StoreError::kInvalidRecord);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    docs_[id] = doc;
    return expected<void, StoreError>::success();
  }

  expected<void, StoreError> Delete(const std::string& id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (docs_.erase(id) == 0U) {
      return expected<void, StoreError>::error(StoreError::kNotFound);
    }
    return expected<void, StoreError>::success();
  }

  bool Exists(const std::string& id) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return docs_.find(id) != docs_.end();
  }

  std::vector<Document> Search(const Query& query) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Document> out;
    for (const auto& kv : docs_) {
      if (query.Matches(kv.second)) out.push_back(Document{kv.first, kv.second});
    }
    return out;
  }

  uint64_t Count(const Query& query) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t n = 0U;
    for (const auto& kv : docs_) {
      if (query.Matches(kv.second)) ++n;
    }
    return n;
  }

  uint64_t DeleteMatching(const Query& query) override {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t n = 0U;
    for (auto it = docs_.begin(); it != docs_.end();) {
      if (query.Matches(it->second)) {
        it = docs_.erase(it);
        ++n;
      } else {
        ++it;
      }
    }
    return n;
  }

 private:
  std::string name_;
  mutable std::mutex mutex_;
  std::map<std::string, nlohmann::json> docs_;
};

// ============================================================================
// Typed helpers
// ============================================================================

template <typename T>
expected<void, StoreError> SaveRecord(Collection& c, const std::string& id,
                                      const T& record) {
  nlohmann::json doc = record;
  auto r = c.Save(id, doc);
  if (!r.has_value()) {
    MWD_LOG_ERROR("Store", "save %s/%s failed: %s", c.Name().c_str(),
                  id.c_str(), ToString(r.get_error()));
  }
  return r;
}

template <typename T>
expected<T, StoreError> LoadRecord(const Collection& c, const std::string& id) {
  auto doc = c.Get(id);
  if (!doc.has_value()) return expected<T, StoreError>::error(doc.get_error());
  return FromDocument<T>(doc.value());
}

// ============================================================================
// Datastore
// ============================================================================

/**
 * @brief The collections the core touches, live and archived.
 *
 * Collections are shared_ptr so one backend can hand the same instance to
 * the dispatcher, the expiry sweep and the archiver.
 */
struct Datastore {
  std::shared_ptr<Collection> submission;
  std::shared_ptr<Collection> file;
  std::shared_ptr<Collection> result;
  std::shared_ptr<Collection> error;
  std::shared_ptr<Collection> service;
  std::shared_ptr<Collection> cached_file;

  std::shared_ptr<Collection> submission_archive;
  std::shared_ptr<Collection> file_archive;
  std::shared_ptr<Collection> result_archive;

  static Datastore InMemory() {
    Datastore ds;
    ds.submission = std::make_shared<MemoryCollection>("submission");
    ds.file = std::make_shared<MemoryCollection>("file");
    ds.result = std::make_shared<MemoryCollection>("result");
    ds.error = std::make_shared<MemoryCollection>("error");
    ds.service = std::make_shared<MemoryCollection>("service");
    ds.cached_file = std::make_shared<MemoryCollection>("cached_file");
    ds.submission_archive =
        std::make_shared<MemoryCollection>("submission_archive");
    ds.file_archive = std::make_shared<MemoryCollection>("file_archive");
    ds.result_archive = std::make_shared<MemoryCollection>("result_archive");
    return ds;
  }

  /// Collections whose records carry expiry_ts.
  std::vector<std::shared_ptr<Collection>> ExpirableCollections() const {
    std::vector<std::shared_ptr<Collection>> out;
    for (const auto& c : {submission, file, result, error, cached_file}) {
      if (c != nullptr) out.push_back(c);
    }
    return out;
  }
};

}  // namespace mwd

#endif  // MWD_DATASTORE_HPP_
