#pragma once

namespace scru128::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "1.0";

}  // namespace scru128::core
