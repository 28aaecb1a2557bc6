#include "config.h"

#include <charconv>
#include <string>
#include <system_error>
#include <utility>

namespace linkswap::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool parse_int(const std::string& value, int& out) {
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

bool handle_dir(CliConfig& config, const std::string& value) {
  config.dir = value;
  return true;
}

bool handle_journal(CliConfig& config, const std::string& value) {
  config.journal_path = value;
  return true;
}

bool handle_max_attempts(CliConfig& config, const std::string& value) {
  int parsed = 0;
  if (!parse_int(value, parsed)) {
    config.option_errors.push_back("Invalid --max-attempts: '" + value + "' (expected integer)");
    return false;
  }
  config.policy.max_attempts = parsed;
  return true;
}

bool handle_reseed_threshold(CliConfig& config, const std::string& value) {
  int parsed = 0;
  if (!parse_int(value, parsed)) {
    config.option_errors.push_back("Invalid --reseed-threshold: '" + value +
                                   "' (expected integer)");
    return false;
  }
  config.policy.reseed_threshold = parsed;
  return true;
}

bool handle_prefix(CliConfig& config, const std::string& value) {
  config.policy.prefix = value;
  return true;
}

bool handle_verbose(CliConfig& config, const std::string& /*value*/) {
  config.verbose = true;
  return true;
}

bool handle_help(CliConfig& config, const std::string& /*value*/) {
  config.help = true;
  return true;
}

Subcommand parse_subcommand(const std::string& name) {
  if (name == "allocate") {
    return Subcommand::kAllocate;
  }
  if (name == "publish") {
    return Subcommand::kPublish;
  }
  if (name == "history") {
    return Subcommand::kHistory;
  }
  return Subcommand::kNone;
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  return {
      {"--dir", true, "Directory for the temporary symlink (allocate)", handle_dir},
      {"--journal", true, "SQLite publish journal (publish, history)", handle_journal},
      {"--max-attempts", true, "Candidate names tried before giving up (default 10000)",
       handle_max_attempts},
      {"--reseed-threshold", true, "Conflicts tolerated before reseeding (default 10)",
       handle_reseed_threshold},
      {"--prefix", true, "Temporary name prefix (default symlink.)", handle_prefix},
      {"--verbose", false, "Print attempt statistics to stderr", handle_verbose},
      {"--help", false, "Show usage", handle_help},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

CliConfig parse_args(int argc, char* argv[]) {
  CliConfig config;
  int start = 1;
  if (argc > 1) {
    const std::string first = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (first.empty() || first[0] != '-') {
      config.subcommand_name = first;
      config.subcommand = parse_subcommand(first);
      start = 2;
    }
  }

  std::vector<std::string> positionals;
  config = apps::parse_options(argc, argv, build_option_registry(), start, std::move(config),
                               &positionals);
  config.positionals = std::move(positionals);
  return config;
}

}  // namespace linkswap::cli
