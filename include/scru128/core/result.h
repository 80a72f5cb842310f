#pragma once

#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

namespace scru128::core {

// Error enumerations following E.14 (use purpose-designed types as error indicators).
// Only recoverable runtime conditions are represented here. Caller misuse (out-of-domain
// field values or timestamps) is reported with std::invalid_argument instead.

enum class ParseError {
  kInvalidLength,     // not 16 bytes and not 25 digits
  kInvalidDigit,      // symbol outside [0-9A-Za-z]
  kOutOfRange,        // 25 valid digits whose value exceeds 2^128 - 1
  kUnsupportedValue,  // value of a type that cannot hold an identifier (e.g. SQL NULL)
};

enum class RandomSourceError {
  kUnavailable,  // entropy device could not be read
  kShortRead,    // entropy device returned fewer bytes than requested
};

enum class GenerateError {
  kRandomSourceFailure,
  kClockRollback,
};

[[nodiscard]] constexpr std::string_view to_string(ParseError error) {
  switch (error) {
    case ParseError::kInvalidLength:
      return "invalid length: expected 16 bytes or 25 digits";
    case ParseError::kInvalidDigit:
      return "invalid digit: expected [0-9a-z]";
    case ParseError::kOutOfRange:
      return "out of 128-bit value range";
    case ParseError::kUnsupportedValue:
      return "unsupported value type";
  }
  return "unknown parse error";
}

[[nodiscard]] constexpr std::string_view to_string(RandomSourceError error) {
  switch (error) {
    case RandomSourceError::kUnavailable:
      return "random source unavailable";
    case RandomSourceError::kShortRead:
      return "random source returned too few bytes";
  }
  return "unknown random source error";
}

[[nodiscard]] constexpr std::string_view to_string(GenerateError error) {
  switch (error) {
    case GenerateError::kRandomSourceFailure:
      return "random number generator failed";
    case GenerateError::kClockRollback:
      return "detected significant clock rollback";
  }
  return "unknown generate error";
}

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

}  // namespace scru128::core
