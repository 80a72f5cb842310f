#include "generate.h"

#include "scru128/core/clock.h"
#include "scru128/core/logger.h"
#include "scru128/generator/generator.h"
#include "scru128/id/identifier.h"
#include "scru128/random/random_source.h"

#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  GenerateRequest request;
  std::optional<std::uint64_t> seed;
  std::optional<std::uint64_t> timestamp;
  bool help{false};
};

// Upper bound on --count, keeps an accidental extra digit from filling the terminal.
constexpr std::uint64_t kMaxCount = 1'000'000;

const std::vector<scru128::apps::Option<GenerateCliConfig>>& generate_options() {
  static const std::vector<scru128::apps::Option<GenerateCliConfig>> options = {
      {"--count", true, "Number of identifiers to generate (default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto n = parse_u64(v);
         if (!n.has_value() || n.value() == 0 || n.value() > kMaxCount) {
           std::cerr << "Invalid --count: " << v << " (valid: 1.." << kMaxCount << ")\n";
           return false;
         }
         c.request.count = static_cast<std::size_t>(n.value());
         return true;
       }},
      {"--format", true, "Output format: text (default) or json",
       [](GenerateCliConfig& c, const std::string& v) {
         if (v == "text") {
           c.request.format = OutputFormat::kText;
         } else if (v == "json") {
           c.request.format = OutputFormat::kJson;
         } else {
           std::cerr << "Invalid --format: " << v << " (valid: text, json)\n";
           return false;
         }
         return true;
       }},
      {"--on-rollback", true, "Clock rollback policy: reset (default) or abort",
       [](GenerateCliConfig& c, const std::string& v) {
         if (v == "reset") {
           c.request.on_rollback = RollbackPolicy::kReset;
         } else if (v == "abort") {
           c.request.on_rollback = RollbackPolicy::kAbort;
         } else {
           std::cerr << "Invalid --on-rollback: " << v << " (valid: reset, abort)\n";
           return false;
         }
         return true;
       }},
      {"--rollback-allowance", true, "Tolerated backward clock jump in ms (default 10000)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto ms = parse_u64(v);
         if (!ms.has_value() || ms.value() > scru128::id::kMaxTimestamp) {
           std::cerr << "Invalid --rollback-allowance: " << v << "\n";
           return false;
         }
         c.request.rollback_allowance = ms.value();
         return true;
       }},
      {"--seed", true, "Use a deterministic (NOT secure) random source with this seed",
       [](GenerateCliConfig& c, const std::string& v) {
         c.seed = parse_u64(v);
         if (!c.seed.has_value()) {
           std::cerr << "Invalid --seed: " << v << "\n";
           return false;
         }
         return true;
       }},
      {"--timestamp", true, "Use a fixed clock reading (ms since the Unix epoch)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto ms = parse_u64(v);
         if (!ms.has_value() || ms.value() == 0 || ms.value() > scru128::id::kMaxTimestamp) {
           std::cerr << "Invalid --timestamp: " << v << " (valid: 1..2^48-1)\n";
           return false;
         }
         c.timestamp = ms;
         return true;
       }},
      {"--help", false, "Show this help",
       [](GenerateCliConfig& c, const std::string& /*v*/) {
         c.help = true;
         return true;
       }},
  };
  return options;
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto& options = generate_options();
  auto parsed = scru128::apps::parse_options(argc, argv, options, 2);

  if (parsed.config.help) {
    std::cout << "Usage: scru128_cli generate [options]\n";
    scru128::apps::print_options(options, std::cout);
    return 0;
  }
  if (!parsed.ok) {
    return 1;
  }
  if (!parsed.positional.empty()) {
    std::cerr << "Unexpected argument: " << parsed.positional.front() << "\n";
    return 1;
  }

  const auto& config = parsed.config;

  std::unique_ptr<scru128::random::IRandomSource> rng;
  if (config.seed.has_value()) {
    rng = std::make_unique<scru128::random::DeterministicRandomSource>(config.seed.value());
  } else {
    rng = scru128::random::make_default_random_source();
  }

  std::shared_ptr<scru128::core::IClock> clock;
  if (config.timestamp.has_value()) {
    clock = std::make_shared<scru128::core::FixedClock>(config.timestamp.value());
  } else {
    clock = std::make_shared<scru128::core::SystemClock>();
  }

  scru128::generator::Generator generator(std::move(rng), clock);
  generator.set_logger(std::make_shared<scru128::core::StderrLogger>());

  return execute_generate(config.request, generator, std::cout, std::cerr);
}
