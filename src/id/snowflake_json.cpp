#include "flake/id/snowflake_json.h"

#include <stdexcept>
#include <string>

namespace flake::id {

void to_json(nlohmann::json& j, const Snowflake& id) {
  j = to_string(id);
}

void from_json(const nlohmann::json& j, Snowflake& id) {
  const auto text = j.get<std::string>();
  const auto parsed = parse_string(text);
  if (!parsed.has_value()) {
    throw std::invalid_argument("Invalid snowflake '" + text +
                                "': " + std::string(core::to_string(parsed.error())));
  }
  id = parsed.value();
}

}  // namespace flake::id
