#pragma once

#include "config.h"
#include <string>

namespace linkswap::cli {

// validate_cli_config checks the parsed command line before anything touches disk.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every flag value parsed (option_errors is empty)
// - a known subcommand is present
// - allocate: exactly one positional <target> and a non-empty --dir
// - publish:  exactly two positionals <target> <link-path>
// - history:  at most one positional [<link-path>] and a --journal path
// - --max-attempts >= 1, --reseed-threshold >= 0
// - --prefix is non-empty and contains no '/'
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

}  // namespace linkswap::cli
