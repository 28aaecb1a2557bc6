#pragma once

#include "linkswap/publish/link_publisher.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

// publish_outcome_to_json renders a completed publish for stdout.
// previous_target is null when the link path was not a symlink before.
nlohmann::json publish_outcome_to_json(const linkswap::publish::PublishOutcome& outcome);

// execute_publish: atomically point `link_path` at `target` and print the outcome as JSON.
// Returns the process exit code. A journal failure is reported on stderr but does
// not change the exit code, since the link itself was published.
int execute_publish(const std::string& target, const std::filesystem::path& link_path,
                    linkswap::publish::LinkPublisher& publisher, bool verbose);
