#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace scru128::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns false when the value is rejected; the handler reports why.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedArgs is the outcome of parse_options: the populated config, the positional
// tokens in order, and whether every flag was recognised and accepted.
template <typename Config>
struct ParsedArgs {
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
  bool ok{true};                        // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Unknown flags and missing values are reported to `err` and clear `ok`.
// A lone "--" ends flag processing; everything after it is positional.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}, std::ostream& err = std::cerr) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  bool flags_done = false;
  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (flags_done) {
      parsed.positional.push_back(arg);
      continue;
    }
    if (arg == "--") {
      flags_done = true;
      continue;
    }

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          const std::string value = argv[++i];
          if (!opt->handler(parsed.config, value)) {
            parsed.ok = false;
          }
        } else {
          err << "Option " << arg << " requires a value\n";
          parsed.ok = false;
        }
      } else if (!opt->handler(parsed.config, "")) {
        parsed.ok = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      err << "Unknown option: " << arg << "\n";
      parsed.ok = false;
    } else {
      parsed.positional.push_back(arg);
    }
  }

  return parsed;
}

// print_options writes one "  <name> <description>" line per option.
template <typename Config>
void print_options(const std::vector<Option<Config>>& options, std::ostream& out) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "  " << opt.description
        << "\n";
  }
}

}  // namespace scru128::apps
