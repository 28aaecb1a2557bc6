#include "linkswap/fs/posix_symlink_filesystem.h"
#include "linkswap/naming/suffix_generator.h"
#include "linkswap/publish/link_publisher.h"
#include "linkswap/publish/temp_symlink_allocator.h"
#include "linkswap/storage/sqlite/sqlite_db.h"
#include "linkswap/storage/sqlite/sqlite_publish_journal.h"

#include "commands/allocate_logic.h"
#include "commands/history_logic.h"
#include "commands/publish_logic.h"
#include "config.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace linkswap;

namespace {

void print_help() {
  std::cout << "linkswap_cli v" << LINKSWAP_VERSION << "\n"
            << "Usage:\n"
            << "  linkswap_cli allocate <target> --dir <directory>\n"
            << "  linkswap_cli publish <target> <link-path> [--journal <db>]\n"
            << "  linkswap_cli history [<link-path>] --journal <db>\n"
            << "Arguments after -- are never read as options.\n"
            << "Options:\n";
  apps::print_usage(std::cout, cli::build_option_registry());
}

// open_journal_db opens (and migrates) the SQLite journal at path.
// Returns nullptr after printing the reason on failure.
std::shared_ptr<storage::sqlite::SqliteDb> open_journal_db(const std::string& path) {
  auto db_result = storage::sqlite::SqliteDb::open(path);
  if (!db_result.has_value()) {
    std::cerr << db_result.error() << "\n";
    return nullptr;
  }
  return db_result.value();
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto config = cli::parse_args(argc, argv);

  if (config.help) {
    print_help();
    return 0;
  }

  // Validate before any output or filesystem access so no partial work happens on error.
  const std::string config_error = cli::validate_cli_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  if (config.verbose) {
    std::cerr << "linkswap_cli v" << LINKSWAP_VERSION << " -- " << config.subcommand_name
              << " (max attempts " << config.policy.max_attempts << ", reseed after "
              << config.policy.reseed_threshold << " conflicts, prefix '"
              << config.policy.prefix << "')\n";
  }

  // Process-lifetime collaborators shared by every subcommand.
  auto& filesystem = fs::process_filesystem();
  publish::TempSymlinkAllocator allocator(naming::process_suffix_generator(), filesystem,
                                          config.policy);

  switch (config.subcommand) {
    case cli::Subcommand::kAllocate:
      return execute_allocate(config.positionals[0], config.dir.value(), allocator,
                              config.verbose);

    case cli::Subcommand::kPublish: {
      std::shared_ptr<storage::sqlite::SqliteDb> db;
      std::unique_ptr<storage::sqlite::SqlitePublishJournal> journal;
      if (config.journal_path.has_value()) {
        db = open_journal_db(config.journal_path.value());
        if (db == nullptr) {
          return 1;
        }
        journal = std::make_unique<storage::sqlite::SqlitePublishJournal>(db);
      } else if (config.verbose) {
        std::cerr << "Journal:     none (pass --journal <db> to record publish history)\n";
      }

      publish::LinkPublisher publisher(allocator, filesystem, journal.get());
      return execute_publish(config.positionals[0], config.positionals[1], publisher,
                             config.verbose);
    }

    case cli::Subcommand::kHistory: {
      auto db = open_journal_db(config.journal_path.value());
      if (db == nullptr) {
        return 1;
      }
      storage::sqlite::SqlitePublishJournal journal(db);
      std::optional<std::string> link_path;
      if (!config.positionals.empty()) {
        link_path = config.positionals[0];
      }
      return execute_history(link_path, journal);
    }

    case cli::Subcommand::kNone:
      break;  // rejected by validate_cli_config
  }

  return 1;
}
