/**
 * @file timer.hpp
 * @brief Periodic task scheduler driven by one background thread.
 *
 * Tasks live in a fixed slot array. The scheduler thread wakes for the
 * nearest deadline or when Stop() is requested, whichever comes first.
 * All public methods are thread-safe.
 */

#ifndef MIRROR_TIMER_HPP_
#define MIRROR_TIMER_HPP_

#include "mirror/platform.hpp"
#include "mirror/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#ifndef MIRROR_TIMER_MAX_TASKS
#define MIRROR_TIMER_MAX_TASKS 4U
#endif

namespace mirror {

enum class TimerError : uint8_t {
  kInvalidPeriod,
  kSlotsFull,
  kNotFound,
  kAlreadyRunning,
};

using TimerTaskFn = void (*)(void* ctx);

class TimerScheduler final {
 public:
  TimerScheduler() = default;
  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;

  /**
   * @brief Register `fn` to run every `period_ms` milliseconds.
   * @return Task id, kInvalidPeriod for 0 ms, kSlotsFull when full.
   */
  expected<uint32_t, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                     void* ctx = nullptr) {
    using R = expected<uint32_t, TimerError>;
    if (period_ms == 0U || fn == nullptr) {
      return R::error(TimerError::kInvalidPeriod);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (!slot.active) {
        slot.fn = fn;
        slot.ctx = ctx;
        slot.period_ns = static_cast<uint64_t>(period_ms) * 1000000ULL;
        slot.next_fire_ns = SteadyNowNs() + slot.period_ns;
        slot.id = next_id_++;
        slot.active = true;
        cv_.notify_all();
        return R::success(slot.id);
      }
    }
    return R::error(TimerError::kSlotsFull);
  }

  expected<void, TimerError> Remove(uint32_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == id) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotFound);
  }

  expected<void, TimerError> Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    running_ = true;
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /** @brief Stop and join the scheduler thread. Safe when not running. */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
      cv_.notify_all();
    }
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  uint32_t TaskCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t n = 0;
    for (const auto& slot : slots_) {
      if (slot.active) ++n;
    }
    return n;
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_ns = 0;
    uint64_t next_fire_ns = 0;
    uint32_t id = 0;
    bool active = false;
  };

  // Tasks run without the lock held so they may call back into the
  // scheduler; a task removed meanwhile still finishes its current run.
  void ScheduleLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      const uint64_t now = SteadyNowNs();
      uint64_t next = UINT64_MAX;
      for (auto& slot : slots_) {
        if (!slot.active) continue;
        if (now >= slot.next_fire_ns) {
          TimerTaskFn fn = slot.fn;
          void* ctx = slot.ctx;
          do {
            slot.next_fire_ns += slot.period_ns;
          } while (slot.next_fire_ns <= now);
          lock.unlock();
          fn(ctx);
          lock.lock();
          if (!running_) return;
        }
        if (slot.active && slot.next_fire_ns < next) {
          next = slot.next_fire_ns;
        }
      }
      if (next == UINT64_MAX) {
        cv_.wait(lock);
      } else {
        const uint64_t after = SteadyNowNs();
        if (next > after) {
          cv_.wait_for(lock, std::chrono::nanoseconds(next - after));
        }
      }
    }
  }

  TaskSlot slots_[MIRROR_TIMER_MAX_TASKS];
  uint32_t next_id_ = 1;
  bool running_ = false;
  std::thread worker_;
  std::condition_variable cv_;
  mutable std::mutex mutex_;
};

}  // namespace mirror

#endif  // MIRROR_TIMER_HPP_
