/**
 * @file test_timer.cpp
 * @brief Tests for timer.hpp
 */

#include "mirror/timer.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

void CountTick(void* ctx) {
  static_cast<std::atomic<int>*>(ctx)->fetch_add(1);
}

bool WaitFor(const std::atomic<int>& counter, int target, int timeout_ms) {
  for (int waited = 0; waited < timeout_ms; waited += 5) {
    if (counter.load() >= target) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return counter.load() >= target;
}

}  // namespace

// ============================================================================
// Basic API Tests
// ============================================================================

TEST_CASE("TimerScheduler Add and Remove", "[timer]") {
  mirror::TimerScheduler sched;

  auto result = sched.Add(100, [](void*) {}, nullptr);
  REQUIRE(result.has_value());
  REQUIRE(result.value() > 0U);
  CHECK(sched.TaskCount() == 1U);

  auto rm = sched.Remove(result.value());
  REQUIRE(rm.has_value());
  CHECK(sched.TaskCount() == 0U);

  auto again = sched.Remove(result.value());
  REQUIRE(!again.has_value());
  CHECK(again.get_error() == mirror::TimerError::kNotFound);
}

TEST_CASE("TimerScheduler invalid period", "[timer]") {
  mirror::TimerScheduler sched;
  auto result = sched.Add(0, [](void*) {}, nullptr);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == mirror::TimerError::kInvalidPeriod);

  auto no_fn = sched.Add(10, nullptr);
  REQUIRE(!no_fn.has_value());
}

TEST_CASE("TimerScheduler slots full", "[timer]") {
  mirror::TimerScheduler sched;
  for (uint32_t i = 0; i < MIRROR_TIMER_MAX_TASKS; ++i) {
    REQUIRE(sched.Add(100, [](void*) {}).has_value());
  }
  auto extra = sched.Add(100, [](void*) {});
  REQUIRE(!extra.has_value());
  REQUIRE(extra.get_error() == mirror::TimerError::kSlotsFull);
}

TEST_CASE("TimerScheduler Start/Stop", "[timer]") {
  mirror::TimerScheduler sched;
  REQUIRE(sched.Start().has_value());
  REQUIRE(sched.IsRunning());

  auto start2 = sched.Start();
  REQUIRE(!start2.has_value());
  REQUIRE(start2.get_error() == mirror::TimerError::kAlreadyRunning);

  sched.Stop();
  REQUIRE(!sched.IsRunning());
  sched.Stop();
}

// ============================================================================
// Firing
// ============================================================================

TEST_CASE("TimerScheduler fires callback", "[timer]") {
  std::atomic<int> ticks{0};
  mirror::TimerScheduler sched;
  REQUIRE(sched.Add(10, CountTick, &ticks).has_value());
  REQUIRE(sched.Start().has_value());

  CHECK(WaitFor(ticks, 3, 2000));
  sched.Stop();
}

TEST_CASE("TimerScheduler task added while running fires", "[timer]") {
  std::atomic<int> ticks{0};
  mirror::TimerScheduler sched;
  REQUIRE(sched.Start().has_value());

  REQUIRE(sched.Add(10, CountTick, &ticks).has_value());

  CHECK(WaitFor(ticks, 1, 2000));
}

TEST_CASE("TimerScheduler removed task stops firing", "[timer]") {
  std::atomic<int> ticks{0};
  mirror::TimerScheduler sched;
  auto id = sched.Add(10, CountTick, &ticks);
  REQUIRE(id.has_value());
  REQUIRE(sched.Start().has_value());
  REQUIRE(WaitFor(ticks, 1, 2000));

  REQUIRE(sched.Remove(id.value()).has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  const int after_remove = ticks.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK(ticks.load() == after_remove);
}

TEST_CASE("TimerScheduler Start after Stop can restart", "[timer]") {
  std::atomic<int> ticks{0};
  mirror::TimerScheduler sched;
  REQUIRE(sched.Add(10, CountTick, &ticks).has_value());
  REQUIRE(sched.Start().has_value());
  sched.Stop();

  const int before = ticks.load();
  REQUIRE(sched.Start().has_value());
  CHECK(WaitFor(ticks, before + 1, 2000));
}

TEST_CASE("TimerScheduler destructor stops thread", "[timer]") {
  std::atomic<int> ticks{0};
  {
    mirror::TimerScheduler sched;
    REQUIRE(sched.Add(5, CountTick, &ticks).has_value());
    REQUIRE(sched.Start().has_value());
    REQUIRE(WaitFor(ticks, 1, 2000));
  }
  const int after = ticks.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  CHECK(ticks.load() == after);
}
