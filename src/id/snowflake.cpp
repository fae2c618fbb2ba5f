#include "flake/id/snowflake.h"

#include <array>
#include <charconv>
#include <limits>
#include <system_error>

namespace flake::id {

namespace {

using ParseResult = core::Result<Snowflake, core::ParseError>;

// digit_value maps a base-64 character to its value, or -1 when it is not in the alphabet.
// Range checks instead of a search through kBase64Alphabet.
int digit_value(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'z') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'Z') {
    return c - 'A' + 36;
  }
  if (c == '+') {
    return 62;
  }
  if (c == '/') {
    return 63;
  }
  return -1;
}

}  // namespace

std::string to_string(const Snowflake id) {
  return std::to_string(id.value);
}

ParseResult parse_string(std::string_view text) {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    // "+-5" is not a number
    if (!text.empty() && text.front() == '-') {
      return ParseResult::err(core::ParseError::kInvalidFormat);
    }
  }
  if (text.empty()) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }

  std::int64_t value = 0;
  const char* const first = text.data();
  const char* const last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, 10);
  if (ec != std::errc{} || ptr != last) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }
  return ParseResult::ok(Snowflake{value});
}

std::string to_base64(const Snowflake id) {
  auto remaining = static_cast<std::uint64_t>(id.value);
  if (remaining == 0) {
    return "0";
  }

  // Filled from the back so the most significant digit ends up first.
  std::array<char, kMaxBase64Digits> buffer{};
  std::size_t pos = buffer.size();
  while (remaining != 0) {
    buffer[--pos] = kBase64Alphabet[remaining % 64];
    remaining /= 64;
  }
  return std::string(buffer.data() + pos, buffer.size() - pos);
}

ParseResult parse_base64(const std::string_view text) {
  if (text.empty()) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }

  constexpr std::uint64_t kShiftLimit = std::numeric_limits<std::uint64_t>::max() >> 6;

  std::uint64_t value = 0;
  bool overflow = false;
  for (const char c : text) {
    const int digit = digit_value(c);
    if (digit < 0) {
      return ParseResult::err(core::ParseError::kInvalidChar);
    }
    if (value > kShiftLimit) {
      overflow = true;
    }
    value = (value << 6) | static_cast<std::uint64_t>(digit);
  }

  // Character errors take precedence, so overflow is only reported after the full scan.
  if (overflow) {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }
  return ParseResult::ok(Snowflake{static_cast<std::int64_t>(value)});
}

std::string to_text(const Snowflake id) {
  return "\"" + to_string(id) + "\"";
}

ParseResult parse_text(const std::string_view text) {
  if (text.size() < 3 || text.front() != '"' || text.back() != '"') {
    return ParseResult::err(core::ParseError::kInvalidFormat);
  }
  return parse_string(text.substr(1, text.size() - 2));
}

}  // namespace flake::id
