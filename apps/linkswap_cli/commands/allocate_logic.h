#pragma once

#include "linkswap/publish/temp_symlink_allocator.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

// allocation_to_json renders a successful allocation for stdout.
nlohmann::json allocation_to_json(const std::string& target,
                                  const linkswap::publish::TempSymlink& temp);

// execute_allocate: create one temp symlink to `target` in `directory` and print it as JSON.
// Takes only the allocator; the caller decides which generator and filesystem back it.
// Returns the process exit code.
int execute_allocate(const std::string& target, const std::filesystem::path& directory,
                     linkswap::publish::TempSymlinkAllocator& allocator, bool verbose);
