#pragma once

#include "scru128/core/result.h"
#include "scru128/id/base36.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

namespace scru128::id {

// Field domains (inclusive maxima).
constexpr std::uint64_t kMaxTimestamp = 0xFFFF'FFFF'FFFFULL;  // 48 bits
constexpr std::uint32_t kMaxCounterHi = 0xFF'FFFF;            // 24 bits
constexpr std::uint32_t kMaxCounterLo = 0xFF'FFFF;            // 24 bits
constexpr std::uint32_t kMaxEntropy = 0xFFFF'FFFF;            // 32 bits

// Identifier is an immutable 128-bit value laid out as 16 big-endian bytes:
//
//   | timestamp (48) | counter_hi (24) | counter_lo (24) | entropy (32) |
//
// Byte order, numeric order of the 128-bit integer, and order of the 25-digit text form all
// agree, so the defaulted comparison over bytes_ is the identifier ordering.
//
// Construction paths: from_fields (validated, throws std::invalid_argument on misuse),
// from_bytes / from_string (fallible, return Result). Default construction yields min().
class Identifier {
 public:
  constexpr Identifier() = default;
  constexpr explicit Identifier(const base36::Bytes& bytes) : bytes_(bytes) {}

  // Compose from field values. Throws std::invalid_argument if any field exceeds its bit width.
  [[nodiscard]] static Identifier from_fields(std::uint64_t timestamp, std::uint32_t counter_hi,
                                              std::uint32_t counter_lo, std::uint32_t entropy);

  // Parse the 25-digit text form (case-insensitive).
  [[nodiscard]] static core::Result<Identifier, core::ParseError> from_string(
      std::string_view text);

  // Accept 16 raw bytes, or the 25-digit text form carried as bytes.
  [[nodiscard]] static core::Result<Identifier, core::ParseError> from_bytes(
      std::span<const std::uint8_t> bytes);

  [[nodiscard]] static constexpr Identifier min() { return Identifier{}; }
  [[nodiscard]] static constexpr Identifier max() {
    base36::Bytes all_ones{};
    all_ones.fill(0xFF);
    return Identifier{all_ones};
  }

  [[nodiscard]] std::uint64_t timestamp() const;
  [[nodiscard]] std::uint32_t counter_hi() const;
  [[nodiscard]] std::uint32_t counter_lo() const;
  [[nodiscard]] std::uint32_t entropy() const;

  // Canonical 25-digit lower-case text form.
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] const base36::Bytes& bytes() const { return bytes_; }

  // -1, 0 or 1 as this is less than, equal to, or greater than other.
  [[nodiscard]] int compare(const Identifier& other) const;

  friend constexpr auto operator<=>(const Identifier&, const Identifier&) = default;

 private:
  base36::Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const Identifier& id);

}  // namespace scru128::id

template <>
struct std::hash<scru128::id::Identifier> {
  std::size_t operator()(const scru128::id::Identifier& id) const noexcept;
};
