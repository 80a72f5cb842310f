#include "scru128/generator/generator.h"

#include <stdexcept>
#include <string>

namespace scru128::generator {

namespace {

void validate_arguments(std::uint64_t timestamp, std::uint64_t rollback_allowance) {
  if (timestamp == 0 || timestamp > id::kMaxTimestamp) {
    throw std::invalid_argument("`timestamp` must be a 48-bit positive integer: " +
                                std::to_string(timestamp));
  }
  if (rollback_allowance > id::kMaxTimestamp) {
    throw std::invalid_argument("`rollback_allowance` out of reasonable range: " +
                                std::to_string(rollback_allowance));
  }
}

}  // namespace

std::string_view to_string(GeneratorStatus status) {
  switch (status) {
    case GeneratorStatus::kNotExecuted:
      return "not_executed";
    case GeneratorStatus::kNewTimestamp:
      return "new_timestamp";
    case GeneratorStatus::kCounterLoInc:
      return "counter_lo_inc";
    case GeneratorStatus::kCounterHiInc:
      return "counter_hi_inc";
    case GeneratorStatus::kTimestampInc:
      return "timestamp_inc";
    case GeneratorStatus::kClockRollback:
      return "clock_rollback";
  }
  return "unknown";
}

Generator::Generator() : Generator(random::make_default_random_source()) {}

Generator::Generator(std::unique_ptr<random::IRandomSource> rng,
                     std::shared_ptr<core::IClock> clock)
    : rng_(std::move(rng)),
      clock_(std::move(clock)),
      logger_(std::make_shared<core::NullLogger>()) {
  if (!rng_) {
    throw std::invalid_argument("Generator requires a random source");
  }
  if (!clock_) {
    throw std::invalid_argument("Generator requires a clock");
  }
}

// ────────────────────────────────────────────────────────────────
// Synchronized entry points
// ────────────────────────────────────────────────────────────────

core::Result<id::Identifier, core::GenerateError> Generator::generate(
    std::uint64_t rollback_allowance) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t now = read_clock();
  auto result = generate_or_reset_core(now, rollback_allowance);
  if (result.has_value()) {
    report(last_status_, now);
  }
  return result;
}

core::Result<id::Identifier, core::GenerateError> Generator::generate_or_abort(
    std::uint64_t rollback_allowance) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t now = read_clock();
  auto result = generate_or_abort_core(now, rollback_allowance);
  if (result.has_value()) {
    report(last_status_, now);
  }
  return result;
}

core::Result<id::Identifier, core::GenerateError> Generator::generate_or_reset(
    std::uint64_t timestamp, std::uint64_t rollback_allowance) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = generate_or_reset_core(timestamp, rollback_allowance);
  if (result.has_value()) {
    report(last_status_, timestamp);
  }
  return result;
}

core::Result<id::Identifier, core::GenerateError> Generator::generate_or_abort(
    std::uint64_t timestamp, std::uint64_t rollback_allowance) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = generate_or_abort_core(timestamp, rollback_allowance);
  if (result.has_value()) {
    report(last_status_, timestamp);
  }
  return result;
}

// ────────────────────────────────────────────────────────────────
// Unsynchronized core
// ────────────────────────────────────────────────────────────────

core::Result<id::Identifier, core::GenerateError> Generator::generate_or_reset_core(
    std::uint64_t timestamp, std::uint64_t rollback_allowance) {
  validate_arguments(timestamp, rollback_allowance);

  // Beyond the allowance: forget the previous timestamp so the given one is adopted as new.
  const bool restart = timestamp + rollback_allowance < state_.timestamp;
  return advance(timestamp, rollback_allowance, restart);
}

core::Result<id::Identifier, core::GenerateError> Generator::generate_or_abort_core(
    std::uint64_t timestamp, std::uint64_t rollback_allowance) {
  validate_arguments(timestamp, rollback_allowance);
  return advance(timestamp, rollback_allowance, false);
}

Generator::GenerateResult Generator::advance(std::uint64_t timestamp,
                                             std::uint64_t rollback_allowance, bool restart) {
  const auto rng_failure = [] {
    return GenerateResult::err(core::GenerateError::kRandomSourceFailure);
  };

  const std::uint64_t previous = restart ? 0 : state_.timestamp;
  GeneratorStatus status = GeneratorStatus::kNotExecuted;

  if (timestamp > previous) {
    const auto lo = rng_->next_u32();
    if (!lo.has_value()) {
      return rng_failure();
    }
    state_.timestamp = timestamp;
    state_.counter_lo = lo.value() & id::kMaxCounterLo;
    if (restart) {
      state_.ts_counter_hi = 0;
    }
    status = GeneratorStatus::kNewTimestamp;
  } else if (timestamp + rollback_allowance >= previous) {
    // Within tolerance (boundary inclusive): keep the previous timestamp and count up.
    if (state_.counter_lo < id::kMaxCounterLo) {
      ++state_.counter_lo;
      status = GeneratorStatus::kCounterLoInc;
    } else if (state_.counter_hi < id::kMaxCounterHi) {
      state_.counter_lo = 0;
      ++state_.counter_hi;
      status = GeneratorStatus::kCounterHiInc;
    } else {
      // Both counters exhausted: borrow one millisecond from the future.
      if (state_.timestamp == id::kMaxTimestamp) {
        throw std::overflow_error("timestamp field exhausted at 2^48 - 1");
      }
      const auto lo = rng_->next_u32();
      if (!lo.has_value()) {
        return rng_failure();
      }
      state_.timestamp += 1;
      state_.counter_hi = 0;
      state_.counter_lo = lo.value() & id::kMaxCounterLo;
      status = GeneratorStatus::kTimestampInc;
    }
  } else {
    return GenerateResult::err(core::GenerateError::kClockRollback);
  }

  if (state_.ts_counter_hi == 0 ||
      state_.timestamp - state_.ts_counter_hi >= kCounterHiRefreshInterval) {
    const auto hi = rng_->next_u32();
    if (!hi.has_value()) {
      return rng_failure();
    }
    state_.ts_counter_hi = state_.timestamp;
    state_.counter_hi = hi.value() & id::kMaxCounterHi;
  }

  const auto entropy = rng_->next_u32();
  if (!entropy.has_value()) {
    return rng_failure();
  }

  last_status_ = restart ? GeneratorStatus::kClockRollback : status;
  return GenerateResult::ok(id::Identifier::from_fields(state_.timestamp, state_.counter_hi,
                                                        state_.counter_lo, entropy.value()));
}

// ────────────────────────────────────────────────────────────────
// Helpers
// ────────────────────────────────────────────────────────────────

std::uint64_t Generator::read_clock() {
  const std::uint64_t now = clock_->now_unix_millis();
  if (now == 0) {
    return 1;
  }
  return now > id::kMaxTimestamp ? id::kMaxTimestamp : now;
}

void Generator::report(GeneratorStatus status, std::uint64_t timestamp) {
  switch (status) {
    case GeneratorStatus::kClockRollback:
      logger_->warn("detected significant clock rollback; generator state reset at timestamp " +
                    std::to_string(timestamp));
      break;
    case GeneratorStatus::kTimestampInc:
      logger_->warn("counters exhausted; timestamp advanced ahead of clock to " +
                    std::to_string(state_.timestamp));
      break;
    default:
      break;
  }
}

GeneratorStatus Generator::last_status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_status_;
}

void Generator::set_logger(std::shared_ptr<core::ILogger> logger) {
  std::lock_guard<std::mutex> lock(mutex_);
  logger_ = logger ? std::move(logger) : std::make_shared<core::NullLogger>();
}

}  // namespace scru128::generator
