#pragma once

#include <string_view>
#include <utility>
#include <variant>

namespace flake::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// ConfigError is reported by generator construction, before any identifier is produced.
enum class ConfigError {
  kSnowflakeOverflow,  // time + node + counter bits exceed the 63 payload bits
  kNodeOverflow,       // node ID does not fit in node_bits
  // Elapsed time since a future epoch is negative, which the time field cannot hold.
  kEpochInFuture,
  // Epoch is further from the current time than the monotonic clock's duration can express
  // (about 292 years), or outside the timestamp range altogether.
  kEpochOutOfRange,
};

// ParseError is reported by the identifier codecs.
enum class ParseError {
  kInvalidFormat,
  kInvalidChar,
};

[[nodiscard]] std::string_view to_string(ConfigError error);
[[nodiscard]] std::string_view to_string(ParseError error);

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace flake::core
