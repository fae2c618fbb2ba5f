#pragma once

#include "flake/id/snowflake.h"

#include <nlohmann/json.hpp>

namespace flake::id {

// ADL hooks for nlohmann::json. A Snowflake is stored as a quoted decimal string so that
// JSON consumers limited to double precision do not lose the low bits.
//
// from_json throws nlohmann::json::type_error when the value is not a string, and
// std::invalid_argument when the string is not a valid decimal identifier.
void to_json(nlohmann::json& j, const Snowflake& id);
void from_json(const nlohmann::json& j, Snowflake& id);

}  // namespace flake::id
