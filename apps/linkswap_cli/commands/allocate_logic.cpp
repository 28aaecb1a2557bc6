#include "allocate_logic.h"

#include <iostream>

nlohmann::json allocation_to_json(const std::string& target,
                                  const linkswap::publish::TempSymlink& temp) {
  nlohmann::json out;
  out["path"] = temp.path.string();
  out["target"] = target;
  out["attempts"] = temp.attempts;
  out["conflicts"] = temp.conflicts;
  out["reseeds"] = temp.reseeds;
  return out;
}

int execute_allocate(const std::string& target, const std::filesystem::path& directory,
                     linkswap::publish::TempSymlinkAllocator& allocator, const bool verbose) {
  const auto result = allocator.allocate(target, directory);
  if (!result.has_value()) {
    std::cerr << "Allocation failed: " << result.error().message() << "\n";
    return 1;
  }

  const auto& temp = result.value();
  if (verbose) {
    std::cerr << "Allocated after " << temp.attempts << " attempt(s), " << temp.conflicts
              << " conflict(s), " << temp.reseeds << " reseed(s)\n";
  }

  std::cout << allocation_to_json(target, temp).dump(2) << "\n";
  return 0;
}
