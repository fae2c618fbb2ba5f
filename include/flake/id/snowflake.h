#pragma once

#include "flake/core/result.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace flake::id {

// Snowflake is a generated 64-bit identifier. It is a plain value: it carries no reference to
// the generator or layout that produced it.
// Using struct (not class) per C.2: the single member has no invariant beyond its type.
struct Snowflake {
  std::int64_t value{0};  // NOLINT(readability-identifier-naming)
  auto operator<=>(const Snowflake&) const = default;
};

// kBase64Alphabet lists the base-64 digits in value order 0..63.
inline constexpr std::string_view kBase64Alphabet =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ+/";

// kMaxBase64Digits is the longest to_base64 output: ceil(64 / 6).
inline constexpr std::size_t kMaxBase64Digits = 11;

// ── Decimal ──────────────────────────────────────────────────────────────────

// to_string formats the identifier as a signed base-10 integer.
[[nodiscard]] std::string to_string(Snowflake id);

// parse_string parses a signed base-10 integer. An optional leading '+' is accepted.
// Fails with kInvalidFormat on empty input, stray characters (including whitespace) or
// values outside the int64 range.
[[nodiscard]] core::Result<Snowflake, core::ParseError> parse_string(std::string_view text);

// ── Base-64 ──────────────────────────────────────────────────────────────────

// to_base64 writes the identifier in base 64, most significant digit first, without leading
// zeros; zero encodes as "0". Negative values are written by their two's-complement bit
// pattern (11 digits).
[[nodiscard]] std::string to_base64(Snowflake id);

// parse_base64 reverses to_base64. Leading zero digits are accepted.
// Fails with kInvalidChar for a character outside kBase64Alphabet, and with kInvalidFormat
// for empty input or a value wider than 64 bits.
[[nodiscard]] core::Result<Snowflake, core::ParseError> parse_base64(std::string_view text);

// ── Text ─────────────────────────────────────────────────────────────────────

// to_text wraps the decimal form in double quotes, e.g. "\"1234\"".
[[nodiscard]] std::string to_text(Snowflake id);

// parse_text requires a quoted string of at least 3 characters whose interior is a valid
// decimal identifier. Fails with kInvalidFormat otherwise.
[[nodiscard]] core::Result<Snowflake, core::ParseError> parse_text(std::string_view text);

}  // namespace flake::id
