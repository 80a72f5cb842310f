#include "scru128/generator/default_generator.h"

#include <catch2/catch.hpp>

#include <string>
#include <thread>
#include <vector>

using namespace scru128;

TEST_CASE("default_generator is a single shared instance", "[generator][default]") {
  CHECK(&generator::default_generator() == &generator::default_generator());
}

TEST_CASE("new_id returns increasing identifiers", "[generator][default]") {
  auto prev = generator::new_id();
  for (int i = 0; i < 10'000; ++i) {
    const auto curr = generator::new_id();
    REQUIRE(prev < curr);
    prev = curr;
  }
  CHECK(generator::default_generator().last_status() != generator::GeneratorStatus::kNotExecuted);
}

TEST_CASE("new_id_string returns the canonical form", "[generator][default]") {
  const std::string a = generator::new_id_string();
  const std::string b = generator::new_id_string();
  CHECK(a.size() == 25);
  CHECK(a < b);

  const auto parsed = id::Identifier::from_string(a);
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().to_string() == a);
}

TEST_CASE("new_id is safe to call from several threads", "[generator][default]") {
  std::vector<std::thread> workers;
  std::vector<std::vector<id::Identifier>> results(4);
  for (std::size_t t = 0; t < results.size(); ++t) {
    workers.emplace_back([&results, t] {
      for (int i = 0; i < 1'000; ++i) {
        results[t].push_back(generator::new_id());
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }
  for (const auto& r : results) {
    REQUIRE(r.size() == 1'000);
    for (std::size_t i = 1; i < r.size(); ++i) {
      CHECK(r[i - 1] < r[i]);
    }
  }
}
