#include "flake/core/clock.h"

namespace flake::core {

namespace {

template <typename Duration>
std::int64_t to_nanos(const Duration d) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();
}

}  // namespace

std::chrono::steady_clock::time_point SystemClock::steady_now() {
  return std::chrono::steady_clock::now();
}

std::chrono::system_clock::time_point SystemClock::system_now() {
  return std::chrono::system_clock::now();
}

ManualClock::ManualClock(const std::chrono::system_clock::time_point system_time,
                         const std::chrono::steady_clock::time_point steady_time)
    : steady_ns_(to_nanos(steady_time.time_since_epoch())),
      system_ns_(to_nanos(system_time.time_since_epoch())) {}

std::chrono::steady_clock::time_point ManualClock::steady_now() {
  const std::chrono::nanoseconds ns{steady_ns_.load(std::memory_order_acquire)};
  return std::chrono::steady_clock::time_point{
      std::chrono::duration_cast<std::chrono::steady_clock::duration>(ns)};
}

std::chrono::system_clock::time_point ManualClock::system_now() {
  const std::chrono::nanoseconds ns{system_ns_.load(std::memory_order_acquire)};
  return std::chrono::system_clock::time_point{
      std::chrono::duration_cast<std::chrono::system_clock::duration>(ns)};
}

void ManualClock::advance(const std::chrono::nanoseconds delta) {
  steady_ns_.fetch_add(delta.count(), std::memory_order_acq_rel);
  system_ns_.fetch_add(delta.count(), std::memory_order_acq_rel);
}

void ManualClock::set_system(const std::chrono::system_clock::time_point system_time) {
  system_ns_.store(to_nanos(system_time.time_since_epoch()), std::memory_order_release);
}

}  // namespace flake::core
