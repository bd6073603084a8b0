/**
 * @file task_group.hpp
 * @brief Bounded fan-out over a dynamic list of work items.
 *
 * Up to max_workers threads pull spawned items from a shared FIFO. A failed
 * or throwing item is recorded and does not stop its siblings; Wait() joins
 * everything and reports the first failure.
 */

#ifndef MWD_TASK_GROUP_HPP_
#define MWD_TASK_GROUP_HPP_

#include "mwd/vocabulary.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace mwd {

class TaskGroup final {
 public:
  using Fn = std::function<expected<void, std::string>()>;

  explicit TaskGroup(uint32_t max_workers)
      : max_workers_(max_workers == 0U ? 1U : max_workers) {}

  ~TaskGroup() { (void)Wait(); }

  TaskGroup(const TaskGroup&) = delete;
  TaskGroup& operator=(const TaskGroup&) = delete;

  /// Queue one item; a worker thread is started while below the bound.
  void Spawn(Fn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(std::move(fn));
    ++spawned_;
    if (workers_.size() < max_workers_ && idle_ == 0U) {
      workers_.emplace_back(&TaskGroup::WorkerLoop, this);
    } else {
      cv_.notify_one();
    }
  }

  /**
   * @brief Run everything queued to completion and join the workers.
   * @return success, kTaskFailed or kTaskThrew for the first failed item.
   */
  expected<void, TaskGroupError> Wait() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      draining_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
      if (t.joinable()) t.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.clear();
    draining_ = false;
    if (first_error_kind_.has_value()) {
      return expected<void, TaskGroupError>::error(*first_error_kind_);
    }
    return expected<void, TaskGroupError>::success();
  }

  std::string FirstError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return first_error_;
  }

  uint32_t FailedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
  }

  uint32_t SpawnedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spawned_;
  }

 private:
  void WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
      ++idle_;
      cv_.wait(lock, [this] { return !pending_.empty() || draining_; });
      --idle_;
      if (pending_.empty()) return;
      Fn fn = std::move(pending_.front());
      pending_.pop_front();
      lock.unlock();
      std::optional<std::string> error;
      TaskGroupError kind = TaskGroupError::kTaskFailed;
      try {
        auto r = fn();
        if (!r.has_value()) error = r.get_error();
      } catch (const std::exception& e) {
        error = e.what();
        kind = TaskGroupError::kTaskThrew;
      }
      lock.lock();
      if (error.has_value()) {
        ++failed_;
        if (!first_error_kind_.has_value()) {
          first_error_kind_ = kind;
          first_error_ = *error;
        }
      }
    }
  }

  uint32_t max_workers_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Fn> pending_;
  std::vector<std::thread> workers_;
  uint32_t idle_ = 0U;
  uint32_t spawned_ = 0U;
  uint32_t failed_ = 0U;
  bool draining_ = false;
  std::optional<TaskGroupError> first_error_kind_;
  std::string first_error_;
};

}  // namespace mwd

#endif  // MWD_TASK_GROUP_HPP_
