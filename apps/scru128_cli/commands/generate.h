#pragma once

// cmd_generate: print one or more new identifiers.
// Usage: scru128_cli generate [--count N] [--format text|json] [--on-rollback reset|abort]
//                             [--rollback-allowance MS] [--seed S] [--timestamp MS]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
