/**
 * @file timer.hpp
 * @brief Periodic task timer driven by one background thread.
 *
 * Callbacks run on the timer thread, outside the internal lock, so a
 * callback may Add() or Remove() tasks. Stop() wakes the thread through a
 * condition variable instead of waiting out the current sleep.
 */

#ifndef MWD_TIMER_HPP_
#define MWD_TIMER_HPP_

#include "mwd/platform.hpp"
#include "mwd/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace mwd {

using TimerTaskFn = std::function<void()>;

/**
 * @brief Periodic timer.
 *
 *   mwd::PeriodicTimer timer;
 *   timer.Add(1000, [&] { cache.RefreshIfStale(mwd::SteadyNowMs()); });
 *   timer.Start();
 *   ...
 *   timer.Stop();
 *
 * Non-copyable, non-movable.
 */
class PeriodicTimer final {
 public:
  PeriodicTimer() = default;
  ~PeriodicTimer() { Stop(); }

  PeriodicTimer(const PeriodicTimer&) = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;
  PeriodicTimer(PeriodicTimer&&) = delete;
  PeriodicTimer& operator=(PeriodicTimer&&) = delete;

  /**
   * @brief Register a periodic task; it first fires one period from now.
   * @return Task id, or kInvalidPeriod when period_ms is 0 or fn is empty.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn) {
    if (period_ms == 0U || !fn) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidPeriod);
    }
    TimerTaskId id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      Task t;
      t.id = next_id_++;
      t.period_ms = period_ms;
      t.next_fire_ms = SteadyNowMs() + period_ms;
      t.fn = std::make_shared<TimerTaskFn>(std::move(fn));
      tasks_.push_back(std::move(t));
      id = TimerTaskId(tasks_.back().id);
    }
    cv_.notify_all();
    return expected<TimerTaskId, TimerError>::success(id);
  }

  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const Task& t) { return t.id == task_id.value(); });
    if (it == tasks_.end()) {
      return expected<void, TimerError>::error(TimerError::kNotFound);
    }
    tasks_.erase(it);
    return expected<void, TimerError>::success();
  }

  expected<void, TimerError> Start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&PeriodicTimer::Loop, this);
    return expected<void, TimerError>::success();
  }

  /// Blocks until the timer thread exits. Safe when not running.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(tasks_.size());
  }

 private:
  struct Task {
    uint32_t id = 0U;
    uint32_t period_ms = 0U;
    uint64_t next_fire_ms = 0U;
    std::shared_ptr<TimerTaskFn> fn;
  };

  void Loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      const uint64_t now = SteadyNowMs();
      std::vector<std::shared_ptr<TimerTaskFn>> due;
      uint64_t next = now + kIdleWaitMs;
      for (auto& t : tasks_) {
        if (now >= t.next_fire_ms) {
          due.push_back(t.fn);
          // Skip missed periods.
          while (t.next_fire_ms <= now) t.next_fire_ms += t.period_ms;
        }
        next = std::min(next, t.next_fire_ms);
      }

      if (!due.empty()) {
        lock.unlock();
        for (auto& fn : due) (*fn)();
        lock.lock();
        continue;
      }
      cv_.wait_for(lock, std::chrono::milliseconds(next - now));
    }
  }

  static constexpr uint64_t kIdleWaitMs = 50U;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Task> tasks_;
  uint32_t next_id_ = 1U;
  std::atomic<bool> running_{false};
  std::thread worker_;
};

}  // namespace mwd

#endif  // MWD_TIMER_HPP_
