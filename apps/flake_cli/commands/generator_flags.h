#pragma once

#include "flake/config/generator_config.h"
#include "flake/core/result.h"

#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// GeneratorFlags collects the generator-related flags shared by subcommands.
// Unset flags fall back to the --config file, then to GeneratorConfig defaults.
struct GeneratorFlags {
  std::optional<std::string> config_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::uint32_t> node_id;      // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> epoch_ms;      // NOLINT(readability-identifier-naming)
  std::optional<unsigned int> time_bits;     // NOLINT(readability-identifier-naming)
  std::optional<unsigned int> node_bits;     // NOLINT(readability-identifier-naming)
  std::optional<unsigned int> counter_bits;  // NOLINT(readability-identifier-naming)
};

namespace detail {

template <typename T>
bool assign_number(std::optional<T>& target, const std::string& flag, const std::string& value) {
  const auto parsed = flake::apps::parse_number<T>(value);
  if (!parsed.has_value()) {
    std::cerr << "Invalid " << flag << ": " << value << "\n";
    return false;
  }
  target = parsed.value();
  return true;
}

}  // namespace detail

// append_generator_flags registers the shared flags on a subcommand whose Config has a
// `GeneratorFlags generator` member.
template <typename Config>
void append_generator_flags(std::vector<flake::apps::Option<Config>>& options) {
  options.push_back({"--config", true, "JSON generator config file",
                     [](Config& c, const std::string& v) {
                       c.generator.config_path = v;
                       return true;
                     }});
  options.push_back({"--node", true, "Node ID",
                     [](Config& c, const std::string& v) {
                       return detail::assign_number(c.generator.node_id, "--node", v);
                     }});
  options.push_back({"--epoch-ms", true, "Epoch as unix milliseconds",
                     [](Config& c, const std::string& v) {
                       return detail::assign_number(c.generator.epoch_ms, "--epoch-ms", v);
                     }});
  options.push_back({"--time-bits", true, "Bits allocated to the timestamp",
                     [](Config& c, const std::string& v) {
                       return detail::assign_number(c.generator.time_bits, "--time-bits", v);
                     }});
  options.push_back({"--node-bits", true, "Bits allocated to the node ID",
                     [](Config& c, const std::string& v) {
                       return detail::assign_number(c.generator.node_bits, "--node-bits", v);
                     }});
  options.push_back({"--counter-bits", true, "Bits allocated to the sequence counter",
                     [](Config& c, const std::string& v) {
                       return detail::assign_number(c.generator.counter_bits, "--counter-bits",
                                                    v);
                     }});
}

// resolve_generator_config loads --config (if given) and applies flag overrides on top.
[[nodiscard]] flake::core::Result<flake::config::GeneratorConfig, std::string>
resolve_generator_config(const GeneratorFlags& flags);
