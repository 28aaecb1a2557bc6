#include "publish_logic.h"

#include "timestamp.h"

#include <iostream>

nlohmann::json publish_outcome_to_json(const linkswap::publish::PublishOutcome& outcome) {
  nlohmann::json out;
  out["link"] = outcome.link_path.string();
  out["target"] = outcome.target;
  if (outcome.previous_target.has_value()) {
    out["previous_target"] = outcome.previous_target.value();
  } else {
    out["previous_target"] = nullptr;
  }
  out["temp_path"] = outcome.temp_path.string();
  out["attempts"] = outcome.attempts;
  out["conflicts"] = outcome.conflicts;
  out["published_at"] = format_utc_iso8601(outcome.published_unix);
  if (outcome.journal_seq.has_value()) {
    out["journal_seq"] = outcome.journal_seq.value();
  } else {
    out["journal_seq"] = nullptr;
  }
  return out;
}

int execute_publish(const std::string& target, const std::filesystem::path& link_path,
                    linkswap::publish::LinkPublisher& publisher, const bool verbose) {
  const auto result = publisher.publish(target, link_path);
  if (!result.has_value()) {
    const auto& error = result.error();
    std::cerr << "Publish failed: " << error.message << "\n";
    if (error.cleanup_code) {
      std::cerr << "WARNING: temporary symlink left behind: " << error.temp_path.string() << ": "
                << error.cleanup_code.message() << "\n";
    }
    return 1;
  }

  const auto& outcome = result.value();
  if (outcome.journal_error.has_value()) {
    std::cerr << "WARNING: link published but journal write failed: "
              << outcome.journal_error.value() << "\n";
  }
  if (verbose) {
    std::cerr << "Published " << outcome.link_path.string() << " -> " << outcome.target
              << " after " << outcome.attempts << " attempt(s)\n";
  }

  std::cout << publish_outcome_to_json(outcome).dump(2) << "\n";
  return 0;
}
