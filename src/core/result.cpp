#include "flake/core/result.h"

namespace flake::core {

std::string_view to_string(const ConfigError error) {
  switch (error) {
    case ConfigError::kSnowflakeOverflow:
      return "total bits allocated is greater than 63";
    case ConfigError::kNodeOverflow:
      return "node ID overflowed its bit allowance";
    case ConfigError::kEpochInFuture:
      return "epoch is later than the current time";
    case ConfigError::kEpochOutOfRange:
      return "epoch is out of range of the monotonic clock";
  }
  return "unknown configuration error";
}

std::string_view to_string(const ParseError error) {
  switch (error) {
    case ParseError::kInvalidFormat:
      return "invalid format";
    case ParseError::kInvalidChar:
      return "invalid character";
  }
  return "unknown parse error";
}

}  // namespace flake::core
