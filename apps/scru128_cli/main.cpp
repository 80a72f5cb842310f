#include "scru128/core/version.h"

#include "commands/generate.h"
#include "commands/inspect.h"
#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& os) {
  os << "Usage: scru128_cli <command> [options]\n"
     << "\n"
     << "Commands:\n"
     << "  generate   Print new identifiers\n"
     << "  inspect    Decode identifiers and print their fields\n"
     << "  --version  Print the version\n"
     << "\n"
     << "Run 'scru128_cli <command> --help' for command options.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "inspect") {
    return cmd_inspect(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << "scru128_cli v" << scru128::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage(std::cout);
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage(std::cerr);
  return 1;
}
