#include "scru128/random/random_source.h"

#include <sys/random.h>
#include <sys/types.h>

#include <cerrno>
#include <stdexcept>
#include <string>

namespace scru128::random {

OsRandomSource::OsRandomSource(std::size_t buffer_size) : buffer_(buffer_size), cursor_(0) {
  if (buffer_size == 0 || buffer_size % 4 != 0) {
    throw std::invalid_argument("OsRandomSource buffer size must be a positive multiple of 4: " +
                                std::to_string(buffer_size));
  }
  // Start drained so the first call performs the first read.
  cursor_ = buffer_.size();
}

OsRandomSource::~OsRandomSource() {
  // Do not leave unused random values behind in freed memory.
  volatile std::uint8_t* p = buffer_.data();
  for (std::size_t i = 0; i < buffer_.size(); ++i) {
    p[i] = 0;  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
}

core::Result<std::uint32_t, core::RandomSourceError> OsRandomSource::next_u32() {
  using R = core::Result<std::uint32_t, core::RandomSourceError>;

  if (cursor_ == buffer_.size()) {
    auto refilled = refill();
    if (!refilled.has_value()) {
      return R::err(refilled.error());
    }
  }

  std::uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    value = (value << 8) | buffer_[cursor_];
    buffer_[cursor_] = 0;
    ++cursor_;
  }
  return R::ok(value);
}

core::Result<bool, core::RandomSourceError> OsRandomSource::refill() {
  using R = core::Result<bool, core::RandomSourceError>;

  std::size_t filled = 0;
  while (filled < buffer_.size()) {
    const ssize_t n = ::getrandom(buffer_.data() + filled, buffer_.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return R::err(core::RandomSourceError::kUnavailable);
    }
    if (n == 0) {
      return R::err(core::RandomSourceError::kShortRead);
    }
    filled += static_cast<std::size_t>(n);
  }

  cursor_ = 0;
  return R::ok(true);
}

core::Result<std::uint32_t, core::RandomSourceError> DeterministicRandomSource::next_u32() {
  // splitmix64
  state_ += 0x9e3779b97f4a7c15ULL;
  std::uint64_t z = state_;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  z ^= z >> 31;
  return core::Result<std::uint32_t, core::RandomSourceError>::ok(
      static_cast<std::uint32_t>(z >> 32));
}

std::unique_ptr<IRandomSource> make_default_random_source() {
  return std::make_unique<OsRandomSource>();
}

}  // namespace scru128::random
