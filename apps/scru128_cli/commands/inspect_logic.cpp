#include "inspect_logic.h"

#include "scru128/id/identifier_json.h"

#include <array>
#include <cstdint>
#include <string>

std::string identifier_to_hex(const scru128::id::Identifier& id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string hex;
  hex.reserve(id.bytes().size() * 2);
  for (const std::uint8_t byte : id.bytes()) {
    hex.push_back(kHex[byte >> 4]);
    hex.push_back(kHex[byte & 0x0F]);
  }
  return hex;
}

nlohmann::json inspect_identifier(const std::string& input, const scru128::id::Identifier& id) {
  nlohmann::json j = scru128::id::identifier_fields_to_json(id);
  j["input"] = input;
  j["hex"] = identifier_to_hex(id);
  return j;
}

int execute_inspect(const std::vector<std::string>& inputs, std::ostream& out,
                    std::ostream& err) {
  nlohmann::json doc = nlohmann::json::array();
  bool all_ok = true;

  for (const auto& input : inputs) {
    auto parsed = scru128::id::Identifier::from_string(input);
    if (!parsed.has_value()) {
      err << "Invalid identifier \"" << input << "\": " << scru128::core::to_string(parsed.error())
          << "\n";
      all_ok = false;
      continue;
    }
    doc.push_back(inspect_identifier(input, parsed.value()));
  }

  if (!all_ok) {
    return 1;
  }
  out << doc.dump(2) << "\n";
  return 0;
}
