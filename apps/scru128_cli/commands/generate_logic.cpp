#include "generate_logic.h"

#include "scru128/id/identifier.h"
#include "scru128/id/identifier_json.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <vector>

std::optional<std::uint64_t> parse_u64(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
  }

  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

int execute_generate(const GenerateRequest& request, scru128::generator::Generator& generator,
                     std::ostream& out, std::ostream& err) {
  std::vector<scru128::id::Identifier> ids;
  ids.reserve(request.count);

  for (std::size_t i = 0; i < request.count; ++i) {
    auto result = request.on_rollback == RollbackPolicy::kAbort
                      ? generator.generate_or_abort(request.rollback_allowance)
                      : generator.generate(request.rollback_allowance);
    if (!result.has_value()) {
      err << "Error: could not generate identifier " << (i + 1) << " of " << request.count
          << ": " << scru128::core::to_string(result.error()) << "\n";
      return 1;
    }
    ids.push_back(result.value());
  }

  if (request.format == OutputFormat::kJson) {
    nlohmann::json doc = nlohmann::json::array();
    for (const auto& id : ids) {
      doc.push_back(scru128::id::identifier_fields_to_json(id));
    }
    out << doc.dump(2) << "\n";
  } else {
    for (const auto& id : ids) {
      out << id << "\n";
    }
  }
  return 0;
}
