#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace linkswap::storage {

// PublishRecord describes one completed publish: `link_path` now resolves to `target`.
struct PublishRecord {
  std::int64_t seq{0};  // assigned by the journal on append; 0 until then
  std::string link_path;
  std::string target;
  std::optional<std::string> previous_target;  // absent if link_path was not a symlink
  std::string temp_path;
  int attempts{0};
  int conflicts{0};
  std::int64_t published_unix{0};  // seconds since the epoch, UTC
};

}  // namespace linkswap::storage
