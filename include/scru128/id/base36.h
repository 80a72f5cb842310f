#pragma once

#include "scru128/core/result.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace scru128::id::base36 {

// Number of base-36 digits needed to hold any 128-bit value: 36^24 < 2^128 < 36^25.
constexpr std::size_t kTextLength = 25;

constexpr std::size_t kByteLength = 16;

using Bytes = std::array<std::uint8_t, kByteLength>;

// Canonical lower-case digit alphabet; digit value == index.
constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

// Returns the digit value of c (case-insensitive) or -1 when c is not a base-36 digit.
[[nodiscard]] constexpr int digit_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'z') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'Z') {
    return c - 'A' + 10;
  }
  return -1;
}

// encode converts a big-endian 128-bit unsigned integer into exactly 25 lower-case digits,
// left-padded with '0'. Lexicographic order of the output equals numeric order of the input.
[[nodiscard]] std::string encode(const Bytes& value);

// decode parses exactly 25 case-insensitive digits into a big-endian 128-bit integer.
// Errors: kInvalidLength, kInvalidDigit, kOutOfRange (value > 2^128 - 1).
[[nodiscard]] core::Result<Bytes, core::ParseError> decode(std::string_view text);

}  // namespace scru128::id::base36
