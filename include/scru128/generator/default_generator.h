#pragma once

#include "scru128/generator/generator.h"
#include "scru128/id/identifier.h"

#include <string>

namespace scru128::generator {

// default_generator returns the process-wide generator, constructed on first use with the OS
// random source and the system clock. Construction happens exactly once, even when the first
// calls race.
//
// Libraries that need isolated ordering guarantees should own a Generator instead.
[[nodiscard]] Generator& default_generator();

// new_id generates an identifier with the process-wide generator.
// Thread-safe. Throws std::runtime_error if the random source fails.
[[nodiscard]] id::Identifier new_id();

// new_id_string is new_id() rendered in the canonical 25-digit form.
[[nodiscard]] std::string new_id_string();

}  // namespace scru128::generator
