#pragma once

#include "flake/core/result.h"
#include "flake/id/snowflake.h"

#include <optional>
#include <string>
#include <string_view>

// Encoding selects one of the three textual forms of an identifier on the command line.
enum class Encoding {
  kDecimal,  // NOLINT(readability-identifier-naming)
  kBase64,   // NOLINT(readability-identifier-naming)
  kText,     // NOLINT(readability-identifier-naming)
};

// parse_encoding accepts "decimal", "base64" and "text".
[[nodiscard]] std::optional<Encoding> parse_encoding(std::string_view name);

[[nodiscard]] std::string encode(flake::id::Snowflake id, Encoding encoding);

[[nodiscard]] flake::core::Result<flake::id::Snowflake, flake::core::ParseError> decode(
    std::string_view text, Encoding encoding);
