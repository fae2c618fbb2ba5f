#include "flake/id/generator.h"

#include <string>
#include <thread>

namespace flake::id {

TimeOverflowError::TimeOverflowError(const std::int64_t elapsed_ms,
                                     const std::int64_t max_time_ms)
    : std::runtime_error("time overflowed its bit allowance: " + std::to_string(elapsed_ms) +
                         " ms since epoch exceeds " + std::to_string(max_time_ms)),
      elapsed_ms_(elapsed_ms),
      max_time_ms_(max_time_ms) {}

Generator::CreateResult Generator::create(const config::GeneratorConfig& config,
                                          std::shared_ptr<core::IClock> clock) {
  if (const auto error = check_layout_and_node(config.node_id, config.layout)) {
    return CreateResult::err(*error);
  }
  if (!core::unix_millis_in_range(config.epoch_unix_ms)) {
    return CreateResult::err(core::ConfigError::kEpochOutOfRange);
  }
  return create(config.node_id, core::from_unix_millis(config.epoch_unix_ms),
                config.layout.time_bits, config.layout.node_bits, config.layout.counter_bits,
                std::move(clock));
}

Generator::CreateResult Generator::create(const std::uint32_t node_id,
                                          const core::Timestamp epoch,
                                          const unsigned int time_bits,
                                          const unsigned int node_bits,
                                          const unsigned int counter_bits,
                                          std::shared_ptr<core::IClock> clock) {
  const Layout layout{time_bits, node_bits, counter_bits};
  if (const auto error = check_layout_and_node(node_id, layout)) {
    return CreateResult::err(*error);
  }

  if (!clock) {
    clock = std::make_shared<core::SystemClock>();
  }
  const auto wall_now = clock->system_now();
  if (epoch > wall_now) {
    return CreateResult::err(core::ConfigError::kEpochInFuture);
  }

  // The constructor subtracts wall_now from epoch in steady_clock units. Measure the distance
  // in milliseconds first, where it cannot overflow.
  constexpr std::int64_t kMaxDistanceMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::duration::max())
          .count();
  if (core::to_unix_millis(wall_now) - core::to_unix_millis(epoch) >= kMaxDistanceMs) {
    return CreateResult::err(core::ConfigError::kEpochOutOfRange);
  }

  // Private constructor: std::make_shared cannot reach it.
  return CreateResult::ok(std::shared_ptr<Generator>(
      new Generator(node_id, epoch, wall_now, layout, std::move(clock))));
}

std::optional<core::ConfigError> Generator::check_layout_and_node(const std::uint32_t node_id,
                                                                 const Layout& layout) {
  const auto valid = layout.validate();
  if (!valid.has_value()) {
    return valid.error();
  }
  if (static_cast<std::int64_t>(node_id) > max_value_bits(layout.node_bits)) {
    return core::ConfigError::kNodeOverflow;
  }
  return std::nullopt;
}

Generator::Generator(const std::uint32_t node_id, const core::Timestamp epoch,
                     const core::Timestamp wall_now, const Layout& layout,
                     std::shared_ptr<core::IClock> clock)
    : clock_(std::move(clock)),
      node_id_(node_id),
      layout_(layout),
      max_time_(max_value_bits(layout.time_bits)),
      max_node_(max_value_bits(layout.node_bits)),
      max_counter_(max_value_bits(layout.counter_bits)),
      wall_epoch_(epoch) {
  // Translate the wall-clock epoch into the monotonic clock's domain.
  // wall_now is the reading create() range-checked the epoch against.
  const auto steady_now = clock_->steady_now();
  epoch_ = steady_now +
           std::chrono::duration_cast<std::chrono::steady_clock::duration>(epoch - wall_now);

  last_generate_ = ms_since_epoch();
}

Snowflake Generator::generate() {
  std::lock_guard<std::mutex> lock(mutex_);

  // Work on copies; state is only committed once the identifier is known to be valid.
  std::int64_t now_ms = ms_since_epoch();
  std::int64_t counter = counter_;

  if (now_ms <= last_generate_) {
    // Same millisecond. A reading behind last_generate_ can only come from an injected
    // clock; it is folded into last_generate_ so timestamps never go backwards.
    now_ms = last_generate_;
    ++counter;
    if (counter > max_counter_) {
      // Sequence space for this millisecond is exhausted: wait for the next one.
      while (now_ms <= last_generate_) {
        std::this_thread::yield();
        now_ms = ms_since_epoch();
        counter = 0;
      }
    }
  } else {
    counter = 0;
  }

  if (now_ms > max_time_) {
    throw TimeOverflowError(now_ms, max_time_);
  }

  last_generate_ = now_ms;
  counter_ = counter;
  return compose(now_ms, node_id_, counter, layout_);
}

SnowflakeParts Generator::decompose(const Snowflake id) const {
  return id::decompose(id, layout_);
}

core::Timestamp Generator::timestamp_of(const Snowflake id) const {
  const auto parts = decompose(id);
  return wall_epoch_ +
         std::chrono::duration_cast<core::Timestamp::duration>(
             std::chrono::milliseconds{parts.time_ms});
}

std::int64_t Generator::ms_since_epoch() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock_->steady_now() - epoch_)
      .count();
}

}  // namespace flake::id
