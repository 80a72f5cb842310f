#include "scru128/id/base36.h"

namespace scru128::id::base36 {

namespace {

// Encoding consumes the 16 input bytes as 2 + 7 + 7: each 7-byte word fits in 56 bits, leaving
// enough headroom in a uint64_t to absorb one base-36 digit shifted left by 56.
constexpr int kEncodeWordBytes = 7;
constexpr int kEncodeWordBits = kEncodeWordBytes * 8;

// Decoding consumes the 25 input digits as 5 + 10 + 10: 36^10 < 2^52, so a 10-digit word plus
// one byte multiplied by 36^10 stays below 2^61.
constexpr int kDecodeWordDigits = 10;
constexpr std::uint64_t kDecodeWordRadix = 3'656'158'440'062'976ULL;  // 36^10

constexpr int kTextLen = static_cast<int>(kTextLength);
constexpr int kByteLen = static_cast<int>(kByteLength);

}  // namespace

std::string encode(const Bytes& value) {
  std::array<std::uint8_t, kTextLength> digits{};

  // Index of the most significant digit written so far; digits left of it are still zero.
  int top = kTextLen;

  for (int begin = kByteLen % kEncodeWordBytes - kEncodeWordBytes; begin < kByteLen;
       begin += kEncodeWordBytes) {
    std::uint64_t carry = 0;
    for (int i = begin < 0 ? 0 : begin; i < begin + kEncodeWordBytes; ++i) {
      carry = (carry << 8) | value[static_cast<std::size_t>(i)];
    }

    // digits = digits * 2^56 + carry, propagated from the least significant digit.
    int j = kTextLen - 1;
    for (; j >= 0 && (carry > 0 || j > top); --j) {
      carry += static_cast<std::uint64_t>(digits[static_cast<std::size_t>(j)]) << kEncodeWordBits;
      digits[static_cast<std::size_t>(j)] = static_cast<std::uint8_t>(carry % 36);
      carry /= 36;
    }
    top = j;
  }

  std::string text(kTextLength, '0');
  for (std::size_t i = 0; i < kTextLength; ++i) {
    text[i] = kDigits[digits[i]];
  }
  return text;
}

core::Result<Bytes, core::ParseError> decode(std::string_view text) {
  using R = core::Result<Bytes, core::ParseError>;

  if (text.size() != kTextLength) {
    return R::err(core::ParseError::kInvalidLength);
  }

  std::array<std::uint8_t, kTextLength> digits{};
  for (std::size_t i = 0; i < kTextLength; ++i) {
    const int v = digit_value(text[i]);
    if (v < 0) {
      return R::err(core::ParseError::kInvalidDigit);
    }
    digits[i] = static_cast<std::uint8_t>(v);
  }

  Bytes value{};
  int top = kByteLen;

  for (int begin = kTextLen % kDecodeWordDigits - kDecodeWordDigits; begin < kTextLen;
       begin += kDecodeWordDigits) {
    std::uint64_t carry = 0;
    for (int i = begin < 0 ? 0 : begin; i < begin + kDecodeWordDigits; ++i) {
      carry = carry * 36 + digits[static_cast<std::size_t>(i)];
    }

    // value = value * 36^10 + carry, propagated from the least significant byte.
    int j = kByteLen - 1;
    for (; carry > 0 || j > top; --j) {
      if (j < 0) {
        return R::err(core::ParseError::kOutOfRange);
      }
      carry += static_cast<std::uint64_t>(value[static_cast<std::size_t>(j)]) * kDecodeWordRadix;
      value[static_cast<std::size_t>(j)] = static_cast<std::uint8_t>(carry & 0xff);
      carry >>= 8;
    }
    top = j;
  }

  return R::ok(value);
}

}  // namespace scru128::id::base36
