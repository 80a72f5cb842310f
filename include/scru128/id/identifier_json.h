#pragma once

#include "scru128/id/identifier.h"

#include <nlohmann/json.hpp>

namespace scru128::id {

/// Serialize an Identifier as its canonical 25-digit JSON string
[[nodiscard]] nlohmann::json identifier_to_json(const Identifier& id);

/// Deserialize an Identifier from a JSON string (either letter case).
/// Throws std::invalid_argument for non-string values or malformed text.
[[nodiscard]] Identifier identifier_from_json(const nlohmann::json& j);

/// Field breakdown used by diagnostics: {"id", "timestamp", "counter_hi", "counter_lo", "entropy"}
[[nodiscard]] nlohmann::json identifier_fields_to_json(const Identifier& id);

// ADL hooks so that `nlohmann::json j = id;` and `j.get<Identifier>()` work.
void to_json(nlohmann::json& j, const Identifier& id);
void from_json(const nlohmann::json& j, Identifier& id);

}  // namespace scru128::id
