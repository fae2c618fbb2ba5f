#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace flake::core {

// Abstract clock interface for time injection.
// Production code reads the real clocks; tests drive a ManualClock.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Monotonic reading. Contract: never decreases between calls.
  virtual std::chrono::steady_clock::time_point steady_now() = 0;

  // Wall-clock reading. May jump in either direction (NTP, manual changes).
  virtual std::chrono::system_clock::time_point system_now() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: std::chrono::steady_clock and std::chrono::system_clock.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::chrono::steady_clock::time_point steady_now() override;
  std::chrono::system_clock::time_point system_now() override;
};

// Manual clock: both readings only move when told to.
// Thread-safe, so one thread may advance time while another is blocked on it.
class ManualClock final : public IClock {
 public:
  explicit ManualClock(std::chrono::system_clock::time_point system_time,
                       std::chrono::steady_clock::time_point steady_time = {});
  ~ManualClock() override = default;

  // Not copyable or movable (contains atomics)
  ManualClock(const ManualClock&) = delete;
  ManualClock& operator=(const ManualClock&) = delete;
  ManualClock(ManualClock&&) = delete;
  ManualClock& operator=(ManualClock&&) = delete;

  std::chrono::steady_clock::time_point steady_now() override;
  std::chrono::system_clock::time_point system_now() override;

  // Move both readings forward by delta.
  void advance(std::chrono::nanoseconds delta);

  // Step the wall clock only; the monotonic reading is untouched.
  void set_system(std::chrono::system_clock::time_point system_time);

 private:
  std::atomic<std::int64_t> steady_ns_;
  std::atomic<std::int64_t> system_ns_;
};

}  // namespace flake::core
