#include "scru128/core/clock.h"

#include <chrono>

namespace scru128::core {

std::uint64_t SystemClock::now_unix_millis() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
  // A pre-1970 system clock is reported as the epoch itself.
  return millis > 0 ? static_cast<std::uint64_t>(millis) : 0;
}

std::uint64_t FixedClock::now_unix_millis() {
  return fixed_millis_.load(std::memory_order_relaxed);
}

void FixedClock::advance(std::int64_t delta_millis) {
  // Two's-complement wraparound makes negative deltas move the clock backwards.
  fixed_millis_.fetch_add(static_cast<std::uint64_t>(delta_millis), std::memory_order_relaxed);
}

}  // namespace scru128::core
