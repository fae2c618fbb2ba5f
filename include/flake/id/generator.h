#pragma once

#include "flake/config/generator_config.h"
#include "flake/core/clock.h"
#include "flake/core/result.h"
#include "flake/core/time.h"
#include "flake/id/layout.h"
#include "flake/id/snowflake.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace flake::id {

// TimeOverflowError is thrown by Generator::generate when the elapsed time since epoch no
// longer fits in time_bits. It is not retryable: every later identifier would wrap around and
// collide with earlier ones. Choose time_bits so this cannot happen within the deployment's
// lifetime (2^time_bits - 1 milliseconds after epoch; 41 bits is about 69.7 years,
// 32 bits about 49.7 days).
class TimeOverflowError final : public std::runtime_error {
 public:
  TimeOverflowError(std::int64_t elapsed_ms, std::int64_t max_time_ms);

  [[nodiscard]] std::int64_t elapsed_ms() const { return elapsed_ms_; }
  [[nodiscard]] std::int64_t max_time_ms() const { return max_time_ms_; }

 private:
  std::int64_t elapsed_ms_;
  std::int64_t max_time_ms_;
};

// Generator issues identifiers for one node.
//
// Thread-safety: generate() is serialized by a single std::mutex held for the whole call,
// including the wait for the next millisecond when the counter is exhausted. Identifiers are
// therefore non-decreasing in the order calls return.
//
// Time: the configured wall-clock epoch is translated once, at construction, into the
// monotonic clock's domain. All later elapsed-time reads use the monotonic clock only, so
// wall-clock steps (NTP, leap seconds, manual changes) do not affect generation.
class Generator {
 public:
  using CreateResult = core::Result<std::shared_ptr<Generator>, core::ConfigError>;

  // Validates the layout (kSnowflakeOverflow), the node ID (kNodeOverflow) and the epoch
  // (kEpochInFuture, kEpochOutOfRange), in that order.
  [[nodiscard]] static CreateResult create(const config::GeneratorConfig& config,
                                           std::shared_ptr<core::IClock> clock = nullptr);

  [[nodiscard]] static CreateResult create(std::uint32_t node_id, core::Timestamp epoch,
                                           unsigned int time_bits, unsigned int node_bits,
                                           unsigned int counter_bits,
                                           std::shared_ptr<core::IClock> clock = nullptr);

  ~Generator() = default;

  // Disable copy/move (mutex not copyable)
  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;
  Generator(Generator&&) = delete;
  Generator& operator=(Generator&&) = delete;

  // generate returns the next identifier. If 2^counter_bits identifiers were already issued
  // in the current millisecond, it blocks until the clock reaches the next one.
  // Throws TimeOverflowError; generator state is left unchanged in that case.
  [[nodiscard]] Snowflake generate();

  [[nodiscard]] std::uint32_t node_id() const { return node_id_; }
  [[nodiscard]] const Layout& layout() const { return layout_; }
  [[nodiscard]] std::int64_t max_time() const { return max_time_; }
  [[nodiscard]] std::int64_t max_node() const { return max_node_; }
  [[nodiscard]] std::int64_t max_counter() const { return max_counter_; }
  [[nodiscard]] core::Timestamp epoch() const { return wall_epoch_; }

  [[nodiscard]] SnowflakeParts decompose(Snowflake id) const;

  // timestamp_of returns the wall-clock time encoded in id, relative to the configured epoch.
  [[nodiscard]] core::Timestamp timestamp_of(Snowflake id) const;

 private:
  Generator(std::uint32_t node_id, core::Timestamp epoch, core::Timestamp wall_now,
            const Layout& layout, std::shared_ptr<core::IClock> clock);

  static std::optional<core::ConfigError> check_layout_and_node(std::uint32_t node_id,
                                                               const Layout& layout);

  std::int64_t ms_since_epoch() const;

  const std::shared_ptr<core::IClock> clock_;
  const std::uint32_t node_id_;
  const Layout layout_;
  const std::int64_t max_time_;
  const std::int64_t max_node_;
  const std::int64_t max_counter_;
  const core::Timestamp wall_epoch_;
  std::chrono::steady_clock::time_point epoch_;

  std::mutex mutex_;
  std::int64_t last_generate_{0};  // guarded by mutex_
  std::int64_t counter_{0};        // guarded by mutex_
};

}  // namespace flake::id
