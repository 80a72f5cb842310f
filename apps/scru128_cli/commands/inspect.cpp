#include "inspect.h"

#include "inspect_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct InspectCliConfig {
  bool help{false};
};

}  // namespace

int cmd_inspect(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<scru128::apps::Option<InspectCliConfig>> options = {
      {"--help", false, "Show this help",
       [](InspectCliConfig& c, const std::string& /*v*/) {
         c.help = true;
         return true;
       }},
  };
  auto parsed = scru128::apps::parse_options(argc, argv, options, 2);

  if (parsed.config.help) {
    std::cout << "Usage: scru128_cli inspect <id> [<id> ...]\n";
    scru128::apps::print_options(options, std::cout);
    return 0;
  }
  if (!parsed.ok) {
    return 1;
  }
  if (parsed.positional.empty()) {
    std::cerr << "Error: at least one identifier is required\n";
    return 1;
  }

  return execute_inspect(parsed.positional, std::cout, std::cerr);
}
