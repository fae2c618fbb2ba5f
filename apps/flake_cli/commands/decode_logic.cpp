#include "decode_logic.h"

#include "flake/id/layout.h"
#include "flake/id/snowflake.h"
#include "flake/id/snowflake_json.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <string>

int execute_decode(const std::string_view input, const Encoding from,
                   const flake::config::GeneratorConfig& config, std::ostream& out,
                   std::ostream& err) {
  const auto valid = config.layout.validate();
  if (!valid.has_value()) {
    err << "Error: " << flake::core::to_string(valid.error()) << "\n";
    return 1;
  }

  const auto decoded = decode(input, from);
  if (!decoded.has_value()) {
    err << "Error: cannot decode '" << input << "': " << flake::core::to_string(decoded.error())
        << "\n";
    return 1;
  }

  const auto parts = flake::id::decompose(decoded.value(), config.layout);

  nlohmann::json j;
  j["base64"] = flake::id::to_base64(decoded.value());
  j["counter"] = parts.counter;
  j["decimal"] = decoded.value();
  j["exact"] = flake::id::layout_fields_disjoint(config.layout);
  j["node"] = parts.node;
  j["text"] = flake::id::to_text(decoded.value());
  j["time_ms"] = parts.time_ms;
  // time_ms is non-negative; null when epoch + time_ms does not fit in 64 bits.
  if (config.epoch_unix_ms <= std::numeric_limits<std::int64_t>::max() - parts.time_ms) {
    j["unix_ms"] = config.epoch_unix_ms + parts.time_ms;
  } else {
    j["unix_ms"] = nullptr;
  }

  out << j.dump(2) << "\n";
  return 0;
}
