#include "encoding.h"

std::optional<Encoding> parse_encoding(const std::string_view name) {
  if (name == "decimal") {
    return Encoding::kDecimal;
  }
  if (name == "base64") {
    return Encoding::kBase64;
  }
  if (name == "text") {
    return Encoding::kText;
  }
  return std::nullopt;
}

std::string encode(const flake::id::Snowflake id, const Encoding encoding) {
  switch (encoding) {
    case Encoding::kBase64:
      return flake::id::to_base64(id);
    case Encoding::kText:
      return flake::id::to_text(id);
    case Encoding::kDecimal:
      break;
  }
  return flake::id::to_string(id);
}

flake::core::Result<flake::id::Snowflake, flake::core::ParseError> decode(
    const std::string_view text, const Encoding encoding) {
  switch (encoding) {
    case Encoding::kBase64:
      return flake::id::parse_base64(text);
    case Encoding::kText:
      return flake::id::parse_text(text);
    case Encoding::kDecimal:
      break;
  }
  return flake::id::parse_string(text);
}
