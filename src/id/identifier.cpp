#include "scru128/id/identifier.h"

#include <ostream>
#include <stdexcept>

namespace scru128::id {

namespace {

// Reads bytes[begin, end) as a big-endian unsigned integer (at most 8 bytes).
std::uint64_t read_be(const base36::Bytes& bytes, std::size_t begin, std::size_t end) {
  std::uint64_t value = 0;
  for (std::size_t i = begin; i < end; ++i) {
    value = (value << 8) | bytes[i];
  }
  return value;
}

// Writes the low (end - begin) bytes of value into bytes[begin, end), big-endian.
void write_be(base36::Bytes& bytes, std::size_t begin, std::size_t end, std::uint64_t value) {
  for (std::size_t i = end; i > begin; --i) {
    bytes[i - 1] = static_cast<std::uint8_t>(value & 0xFF);
    value >>= 8;
  }
}

}  // namespace

Identifier Identifier::from_fields(std::uint64_t timestamp, std::uint32_t counter_hi,
                                   std::uint32_t counter_lo, std::uint32_t entropy) {
  if (timestamp > kMaxTimestamp) {
    throw std::invalid_argument("timestamp exceeds 48 bits: " + std::to_string(timestamp));
  }
  if (counter_hi > kMaxCounterHi) {
    throw std::invalid_argument("counter_hi exceeds 24 bits: " + std::to_string(counter_hi));
  }
  if (counter_lo > kMaxCounterLo) {
    throw std::invalid_argument("counter_lo exceeds 24 bits: " + std::to_string(counter_lo));
  }

  base36::Bytes bytes{};
  write_be(bytes, 0, 6, timestamp);
  write_be(bytes, 6, 9, counter_hi);
  write_be(bytes, 9, 12, counter_lo);
  write_be(bytes, 12, 16, entropy);
  return Identifier{bytes};
}

core::Result<Identifier, core::ParseError> Identifier::from_string(std::string_view text) {
  auto decoded = base36::decode(text);
  if (!decoded.has_value()) {
    return core::Result<Identifier, core::ParseError>::err(decoded.error());
  }
  return core::Result<Identifier, core::ParseError>::ok(Identifier{decoded.value()});
}

core::Result<Identifier, core::ParseError> Identifier::from_bytes(
    std::span<const std::uint8_t> bytes) {
  if (bytes.size() == base36::kByteLength) {
    base36::Bytes copy{};
    for (std::size_t i = 0; i < copy.size(); ++i) {
      copy[i] = bytes[i];
    }
    return core::Result<Identifier, core::ParseError>::ok(Identifier{copy});
  }

  // Anything else may be the text form delivered as raw bytes (e.g. a TEXT column read as BLOB).
  const std::string_view text(reinterpret_cast<const char*>(bytes.data()),  // NOLINT
                              bytes.size());
  return from_string(text);
}

std::uint64_t Identifier::timestamp() const {
  return read_be(bytes_, 0, 6);
}

std::uint32_t Identifier::counter_hi() const {
  return static_cast<std::uint32_t>(read_be(bytes_, 6, 9));
}

std::uint32_t Identifier::counter_lo() const {
  return static_cast<std::uint32_t>(read_be(bytes_, 9, 12));
}

std::uint32_t Identifier::entropy() const {
  return static_cast<std::uint32_t>(read_be(bytes_, 12, 16));
}

std::string Identifier::to_string() const {
  return base36::encode(bytes_);
}

int Identifier::compare(const Identifier& other) const {
  const auto order = *this <=> other;
  if (order < 0) {
    return -1;
  }
  return order > 0 ? 1 : 0;
}

std::ostream& operator<<(std::ostream& os, const Identifier& id) {
  return os << id.to_string();
}

}  // namespace scru128::id

std::size_t std::hash<scru128::id::Identifier>::operator()(
    const scru128::id::Identifier& id) const noexcept {
  // FNV-1a over all 16 bytes.
  std::uint64_t hash = 0xcbf29ce484222325ULL;
  for (const std::uint8_t b : id.bytes()) {
    hash ^= b;
    hash *= 0x100000001b3ULL;
  }
  return static_cast<std::size_t>(hash);
}
