#include "generator_flags.h"

flake::core::Result<flake::config::GeneratorConfig, std::string> resolve_generator_config(
    const GeneratorFlags& flags) {
  using Result = flake::core::Result<flake::config::GeneratorConfig, std::string>;

  flake::config::GeneratorConfig config;
  if (flags.config_path.has_value()) {
    auto loaded = flake::config::load_generator_config(flags.config_path.value());
    if (!loaded.has_value()) {
      return Result::err(loaded.error());
    }
    config = loaded.value();
  }

  if (flags.node_id.has_value()) {
    config.node_id = flags.node_id.value();
  }
  if (flags.epoch_ms.has_value()) {
    config.epoch_unix_ms = flags.epoch_ms.value();
  }
  if (flags.time_bits.has_value()) {
    config.layout.time_bits = flags.time_bits.value();
  }
  if (flags.node_bits.has_value()) {
    config.layout.node_bits = flags.node_bits.value();
  }
  if (flags.counter_bits.has_value()) {
    config.layout.counter_bits = flags.counter_bits.value();
  }

  return Result::ok(config);
}
