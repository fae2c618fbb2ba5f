#pragma once

#include "flake/core/result.h"
#include "flake/id/layout.h"

#include <cstdint>
#include <string>

namespace flake::config {

// kDefaultEpochUnixMs is 2010-11-04T01:42:54.657Z.
constexpr std::int64_t kDefaultEpochUnixMs = 1288834974657;

// GeneratorConfig holds everything needed to construct a generator.
// Every field has an explicit default. Range checks happen in Generator::create, not here.
//
// JSON keys: counter_bits, epoch_unix_ms, node_bits, node_id, time_bits
struct GeneratorConfig {
  std::uint32_t node_id{0};                        // NOLINT(readability-identifier-naming)
  std::int64_t epoch_unix_ms{kDefaultEpochUnixMs};  // NOLINT(readability-identifier-naming)
  id::Layout layout{};                             // NOLINT(readability-identifier-naming)
};

// to_json serializes a GeneratorConfig to a JSON string.
// Keys are sorted alphabetically. Output is deterministic given the same input.
[[nodiscard]] std::string to_json(const GeneratorConfig& config);

// from_json deserializes a GeneratorConfig from a JSON string. Absent keys keep their defaults.
// Throws nlohmann::json::parse_error for malformed JSON. Throws std::invalid_argument when the
// top-level value is not an object, or a value is not an integer in its field's range
// (node_id and the bit widths must be non-negative).
[[nodiscard]] GeneratorConfig from_json(const std::string& json_str);

// load_generator_config reads and deserializes a JSON config file.
// Returns a human-readable error when the file cannot be read or parsed.
[[nodiscard]] core::Result<GeneratorConfig, std::string> load_generator_config(
    const std::string& path);

// generator_config_to_log_string renders a config for startup diagnostics.
// Format: "node=<id> epoch_ms=<ms> layout=<time>/<node>/<counter>"
[[nodiscard]] std::string generator_config_to_log_string(const GeneratorConfig& config);

}  // namespace flake::config
