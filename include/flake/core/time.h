#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace flake::core {

using WallClock = std::chrono::system_clock;
using Timestamp = WallClock::time_point;

// Unix milliseconds representable as a Timestamp.
inline constexpr std::int64_t kMinUnixMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(WallClock::duration::min()).count();
inline constexpr std::int64_t kMaxUnixMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(WallClock::duration::max()).count();

inline Timestamp now_utc() { return WallClock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline bool unix_millis_in_range(const std::int64_t millis) {
  return millis >= kMinUnixMillis && millis <= kMaxUnixMillis;
}

// Throws std::out_of_range when millis does not fit in a Timestamp.
inline Timestamp from_unix_millis(const std::int64_t millis) {
  if (!unix_millis_in_range(millis)) {
    throw std::out_of_range("unix milliseconds out of timestamp range: " +
                            std::to_string(millis));
  }
  return Timestamp{std::chrono::duration_cast<WallClock::duration>(
      std::chrono::milliseconds{millis})};
}

}  // namespace flake::core
