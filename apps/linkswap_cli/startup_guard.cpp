#include "startup_guard.h"

namespace linkswap::cli {

std::string validate_cli_config(const CliConfig& config) {
  if (!config.option_errors.empty()) {
    return "Error: " + config.option_errors.front();
  }

  switch (config.subcommand) {
    case Subcommand::kNone:
      if (config.subcommand_name.empty()) {
        return "Error: missing subcommand (allocate, publish, history)";
      }
      return "Error: unknown subcommand '" + config.subcommand_name +
             "' (valid: allocate, publish, history)";

    case Subcommand::kAllocate:
      if (config.positionals.size() != 1) {
        return "Usage: linkswap_cli allocate <target> --dir <directory>";
      }
      if (!config.dir.has_value() || config.dir->empty()) {
        return "Error: --dir <directory> is required for allocate.\n"
               "       The directory must already exist; it is never created.";
      }
      break;

    case Subcommand::kPublish:
      if (config.positionals.size() != 2) {
        return "Usage: linkswap_cli publish <target> <link-path> [--journal <db>]";
      }
      if (config.positionals[1].empty()) {
        return "Error: <link-path> must not be empty";
      }
      if (config.journal_path.has_value() && config.journal_path->empty()) {
        return "Error: --journal requires a database path";
      }
      break;

    case Subcommand::kHistory:
      if (config.positionals.size() > 1) {
        return "Usage: linkswap_cli history [<link-path>] --journal <db>";
      }
      if (!config.journal_path.has_value() || config.journal_path->empty()) {
        return "Error: --journal <db> is required for history";
      }
      break;
  }

  if (config.policy.max_attempts < 1) {
    return "Error: --max-attempts must be at least 1";
  }
  if (config.policy.reseed_threshold < 0) {
    return "Error: --reseed-threshold must not be negative";
  }
  if (config.policy.prefix.empty()) {
    return "Error: --prefix must not be empty";
  }
  if (config.policy.prefix.find('/') != std::string::npos) {
    return "Error: --prefix must not contain '/'";
  }

  return "";
}

}  // namespace linkswap::cli
