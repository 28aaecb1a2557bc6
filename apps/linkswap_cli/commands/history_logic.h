#pragma once

#include "linkswap/storage/publish_journal.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

// records_to_json renders journal records as a JSON array in journal order.
nlohmann::json records_to_json(const std::vector<linkswap::storage::PublishRecord>& records);

// execute_history: print every record, or only those for `link_path` when given.
// Takes only the journal interface; no concrete storage headers in this TU.
int execute_history(const std::optional<std::string>& link_path,
                    const linkswap::storage::IPublishJournal& journal);
