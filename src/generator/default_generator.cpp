#include "scru128/generator/default_generator.h"

#include <stdexcept>

namespace scru128::generator {

Generator& default_generator() {
  static Generator instance;
  return instance;
}

id::Identifier new_id() {
  auto result = default_generator().generate();
  if (!result.has_value()) {
    throw std::runtime_error("scru128: could not generate identifier: " +
                             std::string(core::to_string(result.error())));
  }
  return result.value();
}

std::string new_id_string() {
  return new_id().to_string();
}

}  // namespace scru128::generator
