#include "scru128/id/base36.h"
#include "scru128/id/identifier.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace scru128;
namespace base36 = scru128::id::base36;

TEST_CASE("digit_value maps both letter cases", "[base36]") {
  CHECK(base36::digit_value('0') == 0);
  CHECK(base36::digit_value('9') == 9);
  CHECK(base36::digit_value('a') == 10);
  CHECK(base36::digit_value('A') == 10);
  CHECK(base36::digit_value('z') == 35);
  CHECK(base36::digit_value('Z') == 35);
  CHECK(base36::digit_value('-') == -1);
  CHECK(base36::digit_value(' ') == -1);
  CHECK(base36::digit_value('\0') == -1);
}

TEST_CASE("encode pads with leading zeros", "[base36]") {
  base36::Bytes one{};
  one[15] = 1;
  CHECK(base36::encode(one) == "0000000000000000000000001");

  base36::Bytes thirty_six{};
  thirty_six[15] = 36;
  CHECK(base36::encode(thirty_six) == "0000000000000000000000010");
}

TEST_CASE("encode of 2^128 - 1 is the largest accepted text", "[base36]") {
  base36::Bytes all_ones{};
  all_ones.fill(0xFF);
  const std::string text = base36::encode(all_ones);
  CHECK(text == "f5lxx1zz5pnorynqglhzmsp33");

  const auto decoded = base36::decode(text);
  REQUIRE(decoded.has_value());
  CHECK(decoded.value() == all_ones);
}

// ── Rejections ─────────────────────────────────────────────────────────────

TEST_CASE("decode rejects wrong lengths", "[base36]") {
  const std::vector<std::string> inputs = {
      "",
      " 036z8puq4tsxsigk6o19y164q",
      "036z8puq54qny1vq3hcbrkweb ",
      "+036z8puq54qny1vq3hfcv3ss0",
      "036z8puq4tsxsigk6o19y164",
  };
  for (const auto& input : inputs) {
    CAPTURE(input);
    const auto r = base36::decode(input);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::ParseError::kInvalidLength);
  }
}

TEST_CASE("decode rejects symbols outside the alphabet", "[base36]") {
  const std::vector<std::string> inputs = {
      "-36z8puq5a7j0ti08oz6zdrdy",
      "036z8puq5a7j0t_08p2cdz28v",
      "036z8pu-5a7j0ti08p3ol8ool",
      "036z8puq5a7j0ti08p4j 6cya",
      "039o\tvvklfmqlqe7fzllz7c7t",
  };
  for (const auto& input : inputs) {
    CAPTURE(input);
    const auto r = base36::decode(input);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::ParseError::kInvalidDigit);
  }
}

TEST_CASE("decode rejects multibyte UTF-8 text", "[base36]") {
  // 23 ASCII digits + one 2-byte character = 25 bytes.
  const std::string two_byte = "039onvvklfmqlqe7fzllz7c\xC3\xA9";
  REQUIRE(two_byte.size() == 25);
  const auto a = base36::decode(two_byte);
  REQUIRE_FALSE(a.has_value());
  CHECK(a.error() == core::ParseError::kInvalidDigit);

  // 23 ASCII digits + one 3-byte character = 26 bytes.
  const std::string three_byte = "039onvvklfmqlqe7fzllz7c\xE5\xAD\x97";
  const auto b = base36::decode(three_byte);
  REQUIRE_FALSE(b.has_value());
  CHECK(b.error() == core::ParseError::kInvalidLength);
}

TEST_CASE("decode rejects values above 2^128 - 1", "[base36]") {
  const std::vector<std::string> inputs = {
      "f5lxx1zz5pnorynqglhzmsp34",
      "f5lxx1zz5pnorynqglhzmsp40",
      "g000000000000000000000000",
      "zzzzzzzzzzzzzzzzzzzzzzzzz",
      "ZZZZZZZZZZZZZZZZZZZZZZZZZ",
  };
  for (const auto& input : inputs) {
    CAPTURE(input);
    const auto r = base36::decode(input);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error() == core::ParseError::kOutOfRange);
  }
}

TEST_CASE("decode error messages name the failure", "[base36]") {
  CHECK(core::to_string(core::ParseError::kInvalidLength).find("length") != std::string::npos);
  CHECK(core::to_string(core::ParseError::kInvalidDigit).find("digit") != std::string::npos);
  CHECK(core::to_string(core::ParseError::kOutOfRange).find("range") != std::string::npos);
}

// ── Order preservation ─────────────────────────────────────────────────────

TEST_CASE("text order follows numeric order across digit boundaries", "[base36]") {
  // Values straddling carries in the base-36 representation.
  const std::vector<std::uint32_t> entropies = {0, 1, 35, 36, 37, 1295, 1296, 46655, 46656,
                                                0xFFFFFFFF};
  std::string previous;
  for (const auto e : entropies) {
    const std::string text = id::Identifier::from_fields(0, 0, 0, e).to_string();
    CAPTURE(e, text);
    CHECK(previous < text);
    previous = text;
  }
}
