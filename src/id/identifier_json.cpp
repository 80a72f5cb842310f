#include "scru128/id/identifier_json.h"

#include <stdexcept>
#include <string>

namespace scru128::id {

nlohmann::json identifier_to_json(const Identifier& id) {
  return id.to_string();
}

Identifier identifier_from_json(const nlohmann::json& j) {
  if (!j.is_string()) {
    throw std::invalid_argument("identifier must be a JSON string, got " +
                                std::string(j.type_name()));
  }

  const auto& text = j.get_ref<const nlohmann::json::string_t&>();
  auto parsed = Identifier::from_string(text);
  if (!parsed.has_value()) {
    throw std::invalid_argument("invalid identifier '" + text +
                                "': " + std::string(core::to_string(parsed.error())));
  }
  return parsed.value();
}

nlohmann::json identifier_fields_to_json(const Identifier& id) {
  nlohmann::json j;
  j["id"] = id.to_string();
  j["timestamp"] = id.timestamp();
  j["counter_hi"] = id.counter_hi();
  j["counter_lo"] = id.counter_lo();
  j["entropy"] = id.entropy();
  return j;
}

void to_json(nlohmann::json& j, const Identifier& id) {
  j = identifier_to_json(id);
}

void from_json(const nlohmann::json& j, Identifier& id) {
  id = identifier_from_json(j);
}

}  // namespace scru128::id
