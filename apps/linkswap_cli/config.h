#pragma once

#include "linkswap/publish/temp_symlink_allocator.h"

#include "shared/arg_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace linkswap::cli {

// Subcommand selects what linkswap_cli does.
// kNone     : no (or an unrecognised) subcommand was given
// kAllocate : create a temp symlink and print its path
// kPublish  : create a temp symlink and rename it over a link path
// kHistory  : print the publish journal
enum class Subcommand {
  kNone,      // NOLINT(readability-identifier-naming)
  kAllocate,  // NOLINT(readability-identifier-naming)
  kPublish,   // NOLINT(readability-identifier-naming)
  kHistory,   // NOLINT(readability-identifier-naming)
};

// CliConfig holds all parsed command-line state.
// Every field has an explicit default; optional fields mean "not configured".
struct CliConfig {
  Subcommand subcommand{Subcommand::kNone};     // NOLINT(readability-identifier-naming)
  std::string subcommand_name;                   // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;          // NOLINT(readability-identifier-naming)
  std::optional<std::string> dir;                // NOLINT(readability-identifier-naming)
  std::optional<std::string> journal_path;       // NOLINT(readability-identifier-naming)
  publish::AllocatorPolicy policy;               // NOLINT(readability-identifier-naming)
  bool verbose{false};                           // NOLINT(readability-identifier-naming)
  bool help{false};                              // NOLINT(readability-identifier-naming)
  std::vector<std::string> option_errors;        // NOLINT(readability-identifier-naming)
};

// build_option_registry lists every flag accepted by linkswap_cli.
std::vector<apps::Option<CliConfig>> build_option_registry();

// parse_args reads argv[1] as the subcommand and the rest as flags and positionals.
CliConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace linkswap::cli
