#include "scru128/id/identifier.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

using scru128::id::Identifier;

namespace {

constexpr std::uint64_t kMaxU48 = scru128::id::kMaxTimestamp;
constexpr std::uint32_t kMaxU24 = scru128::id::kMaxCounterHi;
constexpr std::uint32_t kMaxU32 = scru128::id::kMaxEntropy;

// Strictly ascending: the lower-order field never outweighs a higher-order one.
std::vector<Identifier> ascending() {
  return {
      Identifier::from_fields(0, 0, 0, 0),
      Identifier::from_fields(0, 0, 0, 1),
      Identifier::from_fields(0, 0, 0, kMaxU32),
      Identifier::from_fields(0, 0, 1, 0),
      Identifier::from_fields(0, 0, kMaxU24, 0),
      Identifier::from_fields(0, 1, 0, 0),
      Identifier::from_fields(0, kMaxU24, 0, 0),
      Identifier::from_fields(1, 0, 0, 0),
      Identifier::from_fields(2, 0, 0, 0),
      Identifier::from_fields(kMaxU48, kMaxU24, kMaxU24, kMaxU32),
  };
}

}  // namespace

TEST_CASE("comparison operators agree with field order", "[identifier][ordering]") {
  const auto ids = ascending();
  for (std::size_t i = 1; i < ids.size(); ++i) {
    const auto& prev = ids[i - 1];
    const auto& curr = ids[i];
    CAPTURE(i);

    CHECK(prev < curr);
    CHECK(prev <= curr);
    CHECK(curr > prev);
    CHECK(curr >= prev);
    CHECK(prev != curr);
    CHECK_FALSE(prev == curr);
    CHECK(prev.compare(curr) == -1);
    CHECK(curr.compare(prev) == 1);
  }
}

TEST_CASE("text order and byte order agree with identifier order", "[identifier][ordering]") {
  const auto ids = ascending();
  for (std::size_t i = 1; i < ids.size(); ++i) {
    const auto& prev = ids[i - 1];
    const auto& curr = ids[i];
    CAPTURE(i);

    CHECK(prev.to_string() < curr.to_string());
    CHECK(std::memcmp(prev.bytes().data(), curr.bytes().data(), prev.bytes().size()) < 0);
  }
}

TEST_CASE("equal values compare equal", "[identifier][ordering]") {
  for (const auto& x : ascending()) {
    const auto copy = Identifier::from_fields(x.timestamp(), x.counter_hi(), x.counter_lo(),
                                              x.entropy());
    CHECK(x == copy);
    CHECK(x.compare(copy) == 0);
    CHECK_FALSE(x < copy);
    CHECK_FALSE(x > copy);
  }
}

TEST_CASE("sorting identifiers sorts their text forms", "[identifier][ordering]") {
  auto ids = ascending();
  std::reverse(ids.begin(), ids.end());
  std::sort(ids.begin(), ids.end());
  CHECK(ids == ascending());

  std::vector<std::string> texts;
  for (const auto& x : ids) {
    texts.push_back(x.to_string());
  }
  CHECK(std::is_sorted(texts.begin(), texts.end()));
}
