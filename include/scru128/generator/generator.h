#pragma once

#include "scru128/core/clock.h"
#include "scru128/core/logger.h"
#include "scru128/core/result.h"
#include "scru128/id/identifier.h"
#include "scru128/random/random_source.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace scru128::generator {

// Default tolerated backward clock jump, in milliseconds.
constexpr std::uint64_t kDefaultRollbackAllowance = 10'000;

// counter_hi is re-randomized once the timestamp has advanced this far since its last refresh.
constexpr std::uint64_t kCounterHiRefreshInterval = 1'000;

// GeneratorStatus names the state transition taken by the most recent successful generation.
// Purely descriptive: it never influences the next call.
enum class GeneratorStatus {
  kNotExecuted,    // no identifier generated yet
  kNewTimestamp,   // timestamp moved forward; counter_lo re-randomized
  kCounterLoInc,   // timestamp kept; counter_lo incremented
  kCounterHiInc,   // counter_lo wrapped; counter_hi incremented
  kTimestampInc,   // both counters wrapped; timestamp advanced by one millisecond
  kClockRollback,  // rollback beyond the allowance; state was reset
};

[[nodiscard]] std::string_view to_string(GeneratorStatus status);

// Generator produces identifiers that increase strictly from call to call on the same instance
// as long as the clock does not move backwards by more than the rollback allowance.
//
// State: last timestamp, counter_hi, counter_lo and the timestamp of the last counter_hi refresh.
// Each step of a call is committed as soon as the random draw it needs has succeeded, so a call
// that fails on a later draw keeps the timestamp and counters it already advanced to. A failed
// draw itself commits nothing, and a rollback refused by the abort flavor leaves the state
// untouched.
//
// Thread safety:
// - generate*(...) without the _core suffix serialize on an internal mutex.
// - generate_*_core(...) run the same algorithm WITHOUT locking. Use them only from a single
//   thread or under external synchronization; concurrent unsynchronized calls break both
//   monotonicity and the field domains.
//
// Caller misuse throws std::invalid_argument before any state is touched:
// - timestamp == 0 or timestamp > 2^48 - 1
// - rollback_allowance > 2^48 - 1
class Generator {
 public:
  // OS random source (32-byte buffer) and the system clock.
  Generator();

  // Throws std::invalid_argument if rng or clock is null.
  explicit Generator(std::unique_ptr<random::IRandomSource> rng,
                     std::shared_ptr<core::IClock> clock = std::make_shared<core::SystemClock>());

  ~Generator() = default;

  // Not copyable or movable (owns a mutex and a single-owner random source)
  Generator(const Generator&) = delete;
  Generator& operator=(const Generator&) = delete;
  Generator(Generator&&) = delete;
  Generator& operator=(Generator&&) = delete;

  // Current clock reading, reset on significant rollback. Fails only when the random source
  // fails. The reading is clamped into [1, 2^48 - 1].
  [[nodiscard]] core::Result<id::Identifier, core::GenerateError> generate(
      std::uint64_t rollback_allowance = kDefaultRollbackAllowance);

  // Current clock reading, kClockRollback on significant rollback.
  [[nodiscard]] core::Result<id::Identifier, core::GenerateError> generate_or_abort(
      std::uint64_t rollback_allowance = kDefaultRollbackAllowance);

  // Explicit timestamp; resets state when timestamp + allowance < last timestamp.
  [[nodiscard]] core::Result<id::Identifier, core::GenerateError> generate_or_reset(
      std::uint64_t timestamp, std::uint64_t rollback_allowance);

  // Explicit timestamp; returns kClockRollback and leaves state untouched when
  // timestamp + allowance < last timestamp.
  [[nodiscard]] core::Result<id::Identifier, core::GenerateError> generate_or_abort(
      std::uint64_t timestamp, std::uint64_t rollback_allowance);

  // Unsynchronized variants of the two calls above.
  [[nodiscard]] core::Result<id::Identifier, core::GenerateError> generate_or_reset_core(
      std::uint64_t timestamp, std::uint64_t rollback_allowance);
  [[nodiscard]] core::Result<id::Identifier, core::GenerateError> generate_or_abort_core(
      std::uint64_t timestamp, std::uint64_t rollback_allowance);

  [[nodiscard]] GeneratorStatus last_status() const;

  // Attach a warning sink (NullLogger by default). Passing nullptr restores NullLogger.
  void set_logger(std::shared_ptr<core::ILogger> logger);

 private:
  using GenerateResult = core::Result<id::Identifier, core::GenerateError>;

  struct State {
    std::uint64_t timestamp{0};
    std::uint32_t counter_hi{0};
    std::uint32_t counter_lo{0};
    std::uint64_t ts_counter_hi{0};  // 0 = never refreshed
  };

  // Steps state_ for one identifier. With `restart` set the previous timestamp is ignored, so
  // `timestamp` is adopted as new (rollback reset). Sets last_status_ only on success.
  GenerateResult advance(std::uint64_t timestamp, std::uint64_t rollback_allowance, bool restart);

  [[nodiscard]] std::uint64_t read_clock();
  void report(GeneratorStatus status, std::uint64_t timestamp);

  std::unique_ptr<random::IRandomSource> rng_;
  std::shared_ptr<core::IClock> clock_;
  std::shared_ptr<core::ILogger> logger_;

  mutable std::mutex mutex_;
  State state_;
  GeneratorStatus last_status_{GeneratorStatus::kNotExecuted};
};

}  // namespace scru128::generator
