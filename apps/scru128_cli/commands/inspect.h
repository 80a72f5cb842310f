#pragma once

// cmd_inspect: decode identifiers given on the command line and print their fields as JSON.
// Usage: scru128_cli inspect <id> [<id> ...]
int cmd_inspect(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
