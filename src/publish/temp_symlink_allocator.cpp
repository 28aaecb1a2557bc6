#include "linkswap/publish/temp_symlink_allocator.h"

#include "linkswap/fs/posix_symlink_filesystem.h"

#include <stdexcept>
#include <utility>

namespace linkswap::publish {

std::string AllocationError::message() const {
  switch (kind) {
    case AllocationErrorKind::kExhausted:
      return "no free temporary symlink name after " + std::to_string(attempts) +
             " attempts (last: " + last_candidate.string() + "): " + code.message();
    case AllocationErrorKind::kUnretryable:
      break;
  }
  return "cannot create symlink " + last_candidate.string() + ": " + code.message();
}

TempSymlinkAllocator::TempSymlinkAllocator(naming::ISuffixGenerator& suffixes,
                                           fs::ISymlinkFilesystem& filesystem,
                                           AllocatorPolicy policy)
    : suffixes_(suffixes), filesystem_(filesystem), policy_(std::move(policy)) {
  if (policy_.max_attempts < 1) {
    throw std::invalid_argument("AllocatorPolicy.max_attempts must be at least 1");
  }
  if (policy_.reseed_threshold < 0) {
    throw std::invalid_argument("AllocatorPolicy.reseed_threshold must not be negative");
  }
}

core::Result<TempSymlink, AllocationError> TempSymlinkAllocator::allocate(
    const std::string& target, const std::filesystem::path& directory) {
  using ResultType = core::Result<TempSymlink, AllocationError>;

  int conflicts = 0;
  int reseeds = 0;
  AllocationError last_conflict{.kind = AllocationErrorKind::kExhausted};

  for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    std::filesystem::path candidate = directory / (policy_.prefix + suffixes_.next_suffix());

    const std::error_code ec = filesystem_.create_symlink(target, candidate);
    if (!ec) {
      return ResultType::ok(TempSymlink{
          .path = std::move(candidate),
          .attempts = attempt,
          .conflicts = conflicts,
          .reseeds = reseeds,
      });
    }

    if (!fs::is_conflict(ec)) {
      return ResultType::err(AllocationError{
          .kind = AllocationErrorKind::kUnretryable,
          .code = ec,
          .last_candidate = std::move(candidate),
          .attempts = attempt,
      });
    }

    // Someone else holds this name. The count is not reset after a reseed, so
    // every conflict past the threshold reseeds again.
    ++conflicts;
    if (conflicts > policy_.reseed_threshold) {
      suffixes_.reseed();
      ++reseeds;
    }
    last_conflict.code = ec;
    last_conflict.last_candidate = std::move(candidate);
    last_conflict.attempts = attempt;
  }

  return ResultType::err(std::move(last_conflict));
}

core::Result<std::filesystem::path, AllocationError> allocate_temp_symlink(
    const std::string& target, const std::filesystem::path& directory) {
  using ResultType = core::Result<std::filesystem::path, AllocationError>;

  TempSymlinkAllocator allocator(naming::process_suffix_generator(), fs::process_filesystem());
  auto result = allocator.allocate(target, directory);
  if (!result.has_value()) {
    return ResultType::err(result.error());
  }
  return ResultType::ok(result.value().path);
}

}  // namespace linkswap::publish
