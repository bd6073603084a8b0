/**
 * @file task_queue.hpp
 * @brief Named FIFO queues between the dispatcher and its workers.
 *
 * NamedQueue is a blocking FIFO with a bounded pop timeout so every consumer
 * loop can notice shutdown. QueueHub lazily creates one queue per name; the
 * dispatcher addresses service queues as "service-queue-<name>".
 */

#ifndef MWD_TASK_QUEUE_HPP_
#define MWD_TASK_QUEUE_HPP_

#include "mwd/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mwd {

inline std::string ServiceQueueName(const std::string& service_name) {
  return "service-queue-" + service_name;
}

template <typename T>
class NamedQueue final {
 public:
  explicit NamedQueue(std::string name) : name_(std::move(name)) {}

  NamedQueue(const NamedQueue&) = delete;
  NamedQueue& operator=(const NamedQueue&) = delete;

  const std::string& Name() const noexcept { return name_; }

  expected<void, QueueError> Push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return expected<void, QueueError>::error(QueueError::kClosed);
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return expected<void, QueueError>::success();
  }

  /**
   * @brief Block up to timeout_ms for the next item.
   * @return The item, or nullopt on timeout or when the queue is closed and
   *         drained.
   */
  std::optional<T> Pop(uint32_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                 [this] { return !items_.empty() || closed_; });
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  /// Non-blocking drain of everything currently queued.
  std::vector<T> PopAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out(std::make_move_iterator(items_.begin()),
                       std::make_move_iterator(items_.end()));
    items_.clear();
    return out;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

 private:
  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

template <typename T>
class QueueHub final {
 public:
  std::shared_ptr<NamedQueue<T>> Get(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(name);
    if (it != queues_.end()) return it->second;
    auto q = std::make_shared<NamedQueue<T>>(name);
    queues_.emplace(name, q);
    return q;
  }

  std::shared_ptr<NamedQueue<T>> ForService(const std::string& service_name) {
    return Get(ServiceQueueName(service_name));
  }

  std::vector<std::string> Names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& kv : queues_) out.push_back(kv.first);
    return out;
  }

  void CloseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& kv : queues_) kv.second->Close();
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<NamedQueue<T>>> queues_;
};

}  // namespace mwd

#endif  // MWD_TASK_QUEUE_HPP_
