#include "history_logic.h"

#include "timestamp.h"

#include <iostream>
#include <utility>

nlohmann::json records_to_json(const std::vector<linkswap::storage::PublishRecord>& records) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& record : records) {
    nlohmann::json entry;
    entry["seq"] = record.seq;
    entry["link"] = record.link_path;
    entry["target"] = record.target;
    entry["previous_target"] =
        record.previous_target.has_value() ? nlohmann::json(record.previous_target.value())
                                           : nlohmann::json(nullptr);
    entry["temp_path"] = record.temp_path;
    entry["attempts"] = record.attempts;
    entry["conflicts"] = record.conflicts;
    entry["published_at"] = format_utc_iso8601(record.published_unix);
    out.push_back(std::move(entry));
  }
  return out;
}

int execute_history(const std::optional<std::string>& link_path,
                    const linkswap::storage::IPublishJournal& journal) {
  const auto records =
      link_path.has_value() ? journal.list(link_path.value()) : journal.list_all();
  std::cout << records_to_json(records).dump(2) << "\n";
  return 0;
}
