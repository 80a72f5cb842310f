#pragma once

#include "scru128/generator/generator.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

enum class OutputFormat {
  kText,  // one canonical string per line
  kJson,  // array of field breakdowns
};

enum class RollbackPolicy {
  kReset,  // start a fresh sequence (monotonicity broken once)
  kAbort,  // stop with an error
};

struct GenerateRequest {
  std::size_t count{1};
  OutputFormat format{OutputFormat::kText};
  RollbackPolicy on_rollback{RollbackPolicy::kReset};
  std::uint64_t rollback_allowance{scru128::generator::kDefaultRollbackAllowance};
};

// parse_u64: strict decimal parse (digits only, no sign, no overflow). nullopt otherwise.
std::optional<std::uint64_t> parse_u64(std::string_view text);

// execute_generate: draw request.count identifiers from `generator` (which reads its own clock)
// and print them to `out`. Generation failures go to `err`.
// Returns 0 on success, 1 on the first failure (nothing is printed to `out` in that case).
int execute_generate(const GenerateRequest& request, scru128::generator::Generator& generator,
                     std::ostream& out, std::ostream& err);
