#include "flake/id/layout.h"

namespace flake::id {

namespace {

struct BitRange {
  unsigned int low;
  unsigned int high;  // exclusive; clamped to 64

  [[nodiscard]] bool empty() const { return low >= high; }
};

BitRange field_range(const unsigned int shift, const unsigned int width) {
  const unsigned int high = shift + width > 64 ? 64 : shift + width;
  return BitRange{shift, high};
}

bool overlaps(const BitRange a, const BitRange b) {
  if (a.empty() || b.empty()) {
    return false;
  }
  return a.low < b.high && b.low < a.high;
}

}  // namespace

core::Result<bool, core::ConfigError> Layout::validate() const {
  if (total_bits() > kPayloadBits) {
    return core::Result<bool, core::ConfigError>::err(core::ConfigError::kSnowflakeOverflow);
  }
  return core::Result<bool, core::ConfigError>::ok(true);
}

Snowflake compose(const std::int64_t time_ms, const std::int64_t node, const std::int64_t counter,
                  const Layout& layout) {
  // Unsigned arithmetic: the node field may be shifted past bit 63 and must wrap, not overflow.
  const std::uint64_t time_part = static_cast<std::uint64_t>(time_ms)
                                  << (kPayloadBits - layout.time_bits);
  const std::uint64_t node_part = static_cast<std::uint64_t>(node)
                                  << (kPayloadBits - layout.counter_bits);
  const auto counter_part = static_cast<std::uint64_t>(counter);
  return Snowflake{static_cast<std::int64_t>(time_part | node_part | counter_part)};
}

SnowflakeParts decompose(const Snowflake id, const Layout& layout) {
  const auto raw = static_cast<std::uint64_t>(id.value);
  const auto time_mask = static_cast<std::uint64_t>(max_value_bits(layout.time_bits));
  const auto node_mask = static_cast<std::uint64_t>(max_value_bits(layout.node_bits));
  const auto counter_mask = static_cast<std::uint64_t>(max_value_bits(layout.counter_bits));

  SnowflakeParts parts;
  parts.time_ms = static_cast<std::int64_t>((raw >> (kPayloadBits - layout.time_bits)) & time_mask);
  parts.node = static_cast<std::int64_t>((raw >> (kPayloadBits - layout.counter_bits)) & node_mask);
  parts.counter = static_cast<std::int64_t>(raw & counter_mask);
  return parts;
}

bool layout_fields_disjoint(const Layout& layout) {
  const BitRange time = field_range(kPayloadBits - layout.time_bits, layout.time_bits);
  const BitRange node = field_range(kPayloadBits - layout.counter_bits, layout.node_bits);
  const BitRange counter = field_range(0, layout.counter_bits);

  // A node field that runs past bit 63 loses its high bits, so decompose cannot recover it.
  const bool node_truncated =
      static_cast<unsigned long long>(kPayloadBits - layout.counter_bits) + layout.node_bits > 64;

  return !node_truncated && !overlaps(time, node) && !overlaps(time, counter) &&
         !overlaps(node, counter);
}

}  // namespace flake::id
