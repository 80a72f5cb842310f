#pragma once

#include "scru128/core/result.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace scru128::random {

// Abstract source of uniformly distributed 32-bit values.
// Allows production code to draw from the OS entropy pool while tests/demos use a seeded,
// reproducible sequence.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
//
// Contract: implementations need not be thread-safe; the generator calls next_u32() only while
// holding its own lock. A failure is reported as an error value and never as a partial value.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  virtual core::Result<std::uint32_t, core::RandomSourceError> next_u32() = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production source: cryptographically strong bytes from the kernel (getrandom(2)).
//
// Bytes are fetched buffer_size at a time and handed out four per call. Small reads from the
// kernel are comparatively slow, so a larger buffer trades memory residency of future random
// values for throughput. The default (32 bytes) keeps both costs small.
class OsRandomSource final : public IRandomSource {
 public:
  static constexpr std::size_t kDefaultBufferSize = 32;

  // Throws std::invalid_argument unless buffer_size is a positive multiple of 4.
  explicit OsRandomSource(std::size_t buffer_size = kDefaultBufferSize);
  ~OsRandomSource() override;

  OsRandomSource(const OsRandomSource&) = delete;
  OsRandomSource& operator=(const OsRandomSource&) = delete;
  OsRandomSource(OsRandomSource&&) = delete;
  OsRandomSource& operator=(OsRandomSource&&) = delete;

  core::Result<std::uint32_t, core::RandomSourceError> next_u32() override;

 private:
  [[nodiscard]] core::Result<bool, core::RandomSourceError> refill();

  std::vector<std::uint8_t> buffer_;
  std::size_t cursor_;
};

// Deterministic source: splitmix64 sequence from a fixed seed.
// For tests and demos where reproducible output is required. NOT cryptographically secure.
class DeterministicRandomSource final : public IRandomSource {
 public:
  explicit DeterministicRandomSource(std::uint64_t seed) : state_(seed) {}

  core::Result<std::uint32_t, core::RandomSourceError> next_u32() override;

 private:
  std::uint64_t state_;
};

// Factory for the source used by default-constructed generators.
[[nodiscard]] std::unique_ptr<IRandomSource> make_default_random_source();

}  // namespace scru128::random
