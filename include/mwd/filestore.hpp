/**
 * @file filestore.hpp
 * @brief Binary object store collaborator keyed by content hash.
 *
 * Two implementations: a directory tree (one file per key, fanned out by the
 * first two hash characters) and an in-process map used by tests and by
 * deployments without a real blob backend.
 */

#ifndef MWD_FILESTORE_HPP_
#define MWD_FILESTORE_HPP_

#include "mwd/log.hpp"
#include "mwd/vocabulary.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

namespace mwd {

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual expected<void, StoreError> Upload(const std::string& local_path,
                                            const std::string& key) = 0;
  virtual expected<void, StoreError> Download(const std::string& key,
                                              const std::string& local_path) = 0;
  virtual expected<void, StoreError> Delete(const std::string& key) = 0;
  virtual bool Exists(const std::string& key) const = 0;
};

namespace detail {

inline expected<std::string, StoreError> ReadWholeFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return expected<std::string, StoreError>::error(StoreError::kNotFound);
  }
  std::string data((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  if (in.bad()) return expected<std::string, StoreError>::error(StoreError::kIoError);
  return expected<std::string, StoreError>::success(std::move(data));
}

inline expected<void, StoreError> WriteWholeFile(const std::string& path,
                                                 const std::string& data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) return expected<void, StoreError>::error(StoreError::kIoError);
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!out.good()) return expected<void, StoreError>::error(StoreError::kIoError);
  return expected<void, StoreError>::success();
}

}  // namespace detail

// ============================================================================
// DirectoryObjectStore
// ============================================================================

class DirectoryObjectStore final : public ObjectStore {
 public:
  explicit DirectoryObjectStore(std::filesystem::path root)
      : root_(std::move(root)) {}

  const std::filesystem::path& Root() const noexcept { return root_; }

  expected<void, StoreError> Upload(const std::string& local_path,
                                    const std::string& key) override {
    const auto dst = PathFor(key);
    std::error_code ec;
    std::filesystem::create_directories(dst.parent_path(), ec);
    if (ec) {
      MWD_LOG_ERROR("Store", "mkdir %s: %s", dst.parent_path().c_str(),
                    ec.message().c_str());
      return expected<void, StoreError>::error(StoreError::kIoError);
    }
    if (!std::filesystem::exists(local_path, ec)) {
      return expected<void, StoreError>::error(StoreError::kNotFound);
    }
    std::filesystem::copy_file(local_path, dst,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
      MWD_LOG_ERROR("Store", "upload %s: %s", key.c_str(), ec.message().c_str());
      return expected<void, StoreError>::error(StoreError::kIoError);
    }
    return expected<void, StoreError>::success();
  }

  expected<void, StoreError> Download(const std::string& key,
                                      const std::string& local_path) override {
    const auto src = PathFor(key);
    std::error_code ec;
    if (!std::filesystem::exists(src, ec)) {
      return expected<void, StoreError>::error(StoreError::kNotFound);
    }
    std::filesystem::copy_file(src, local_path,
                               std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
      MWD_LOG_ERROR("Store", "download %s: %s", key.c_str(),
                    ec.message().c_str());
      return expected<void, StoreError>::error(StoreError::kIoError);
    }
    return expected<void, StoreError>::success();
  }

  expected<void, StoreError> Delete(const std::string& key) override {
    std::error_code ec;
    const bool removed = std::filesystem::remove(PathFor(key), ec);
    if (ec) return expected<void, StoreError>::error(StoreError::kIoError);
    if (!removed) return expected<void, StoreError>::error(StoreError::kNotFound);
    return expected<void, StoreError>::success();
  }

  bool Exists(const std::string& key) const override {
    std::error_code ec;
    return std::filesystem::exists(PathFor(key), ec);
  }

 private:
  std::filesystem::path PathFor(const std::string& key) const {
    if (key.size() < 2U) return root_ / key;
    return root_ / key.substr(0, 2) / key;
  }

  std::filesystem::path root_;
};

// ============================================================================
// MemoryObjectStore
// ============================================================================

class MemoryObjectStore final : public ObjectStore {
 public:
  expected<void, StoreError> Upload(const std::string& local_path,
                                    const std::string& key) override {
    auto data = detail::ReadWholeFile(local_path);
    if (!data.has_value()) return expected<void, StoreError>::error(data.get_error());
    Put(key, std::move(data).value());
    return expected<void, StoreError>::success();
  }

  expected<void, StoreError> Download(const std::string& key,
                                      const std::string& local_path) override {
    std::string data;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = blobs_.find(key);
      if (it == blobs_.end()) {
        return expected<void, StoreError>::error(StoreError::kNotFound);
      }
      data = it->second;
    }
    return detail::WriteWholeFile(local_path, data);
  }

  expected<void, StoreError> Delete(const std::string& key) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blobs_.erase(key) == 0U) {
      return expected<void, StoreError>::error(StoreError::kNotFound);
    }
    return expected<void, StoreError>::success();
  }

  bool Exists(const std::string& key) const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.find(key) != blobs_.end();
  }

  /// Direct insertion, bypassing the local filesystem.
  void Put(const std::string& key, std::string data) {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[key] = std::move(data);
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> blobs_;
};

}  // namespace mwd

#endif  // MWD_FILESTORE_HPP_
