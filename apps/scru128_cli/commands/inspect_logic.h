#pragma once

#include "scru128/id/identifier.h"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

// Lower-case hexadecimal rendering of the 16 bytes (32 digits).
std::string identifier_to_hex(const scru128::id::Identifier& id);

// Field breakdown plus "input" (as given) and "hex" (binary form).
nlohmann::json inspect_identifier(const std::string& input, const scru128::id::Identifier& id);

// execute_inspect: parse every input and print a JSON array of breakdowns to `out`.
// Every unparseable input is reported to `err`; if any fails nothing is printed to `out`
// and 1 is returned.
int execute_inspect(const std::vector<std::string>& inputs, std::ostream& out,
                    std::ostream& err);
