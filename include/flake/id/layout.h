#pragma once

#include "flake/core/result.h"
#include "flake/id/snowflake.h"

#include <cstdint>

namespace flake::id {

// kPayloadBits is the number of usable bits in an identifier; bit 63 (sign) is never set
// by the time or counter fields.
constexpr unsigned int kPayloadBits = 63;

// Layout partitions the payload bits among the time, node and counter fields.
struct Layout {
  unsigned int time_bits{41};     // NOLINT(readability-identifier-naming)
  unsigned int node_bits{10};     // NOLINT(readability-identifier-naming)
  unsigned int counter_bits{12};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] unsigned long long total_bits() const {
    return static_cast<unsigned long long>(time_bits) + node_bits + counter_bits;
  }

  // Fails with kSnowflakeOverflow when total_bits() exceeds kPayloadBits.
  [[nodiscard]] core::Result<bool, core::ConfigError> validate() const;

  bool operator==(const Layout&) const = default;
};

// SnowflakeParts holds the three fields read back out of an identifier.
struct SnowflakeParts {
  std::int64_t time_ms{0};  // NOLINT(readability-identifier-naming)
  std::int64_t node{0};     // NOLINT(readability-identifier-naming)
  std::int64_t counter{0};  // NOLINT(readability-identifier-naming)

  bool operator==(const SnowflakeParts&) const = default;
};

// max_value_bits returns 2^bits - 1. bits must not exceed kPayloadBits.
[[nodiscard]] constexpr std::int64_t max_value_bits(const unsigned int bits) {
  return static_cast<std::int64_t>((std::uint64_t{1} << bits) - 1);
}

// compose packs the fields into an identifier:
//   time    << (63 - time_bits)
//   node    << (63 - counter_bits)
//   counter (unshifted)
// The node shift uses counter_bits, not node_bits. Identifiers already issued depend on this
// placement, so decoders must use the same rule. Bits shifted past bit 63 are dropped.
// The layout must already be valid.
[[nodiscard]] Snowflake compose(std::int64_t time_ms, std::int64_t node, std::int64_t counter,
                                const Layout& layout);

// decompose reads the fields back with the shifts compose uses. Each field is masked to its
// width. When fields overlap under the packing rule (see layout_fields_disjoint), the
// overlapping bits are OR-ed together and the result is only meaningful for zero-valued
// neighbours.
[[nodiscard]] SnowflakeParts decompose(Snowflake id, const Layout& layout);

// layout_fields_disjoint reports whether the time, node and counter fields occupy
// non-overlapping bit ranges under the packing rule, i.e. whether decompose is exact for
// every identifier the layout can produce.
[[nodiscard]] bool layout_fields_disjoint(const Layout& layout);

}  // namespace flake::id
