#pragma once

#include "linkswap/core/result.h"
#include "linkswap/fs/symlink_filesystem.h"
#include "linkswap/naming/suffix_generator.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace linkswap::publish {

// AllocatorPolicy bounds the retry loop.
//
// - max_attempts: total candidate paths tried before giving up (>= 1)
// - reseed_threshold: once the per-call conflict count exceeds this value, every
//   further conflict reseeds the suffix generator (the count is never reset)
// - prefix: literal placed before the suffix in the candidate filename
struct AllocatorPolicy {
  int max_attempts{10000};          // NOLINT(readability-identifier-naming)
  int reseed_threshold{10};         // NOLINT(readability-identifier-naming)
  std::string prefix{"symlink."};  // NOLINT(readability-identifier-naming)
};

// TempSymlink is a freshly created symlink now owned by the caller, plus the
// statistics of the call that produced it.
struct TempSymlink {
  std::filesystem::path path;
  int attempts{0};
  int conflicts{0};
  int reseeds{0};
};

enum class AllocationErrorKind {
  kUnretryable,  // OS error other than "already exists"; passed through on first sight
  kExhausted,    // every attempt collided; `code` is the last file_exists error
};

struct AllocationError {
  AllocationErrorKind kind{AllocationErrorKind::kUnretryable};
  std::error_code code;
  std::filesystem::path last_candidate;
  int attempts{0};

  // Human-readable one-line description for diagnostics.
  [[nodiscard]] std::string message() const;
};

// TempSymlinkAllocator creates a symlink under a collision-free temporary name.
//
// Each attempt asks the suffix generator for a suffix, forms
//   directory / (policy.prefix + suffix)
// and tries to create a symlink there in one atomic OS call. "Already exists"
// means another writer won that name: count it and try again. Any other failure
// ends the call immediately with that error unchanged.
//
// Thread-safety: safe to share across threads as long as the injected generator
// and filesystem are. No in-process lock is held around filesystem calls.
class TempSymlinkAllocator {
 public:
  // Throws std::invalid_argument if policy.max_attempts < 1 or
  // policy.reseed_threshold < 0.
  TempSymlinkAllocator(naming::ISuffixGenerator& suffixes, fs::ISymlinkFilesystem& filesystem,
                       AllocatorPolicy policy = {});

  // Create a symlink whose content is `target` inside `directory`.
  // `directory` must already exist; it is never created here.
  [[nodiscard]] core::Result<TempSymlink, AllocationError> allocate(
      const std::string& target, const std::filesystem::path& directory);

  [[nodiscard]] const AllocatorPolicy& policy() const { return policy_; }

 private:
  naming::ISuffixGenerator& suffixes_;
  fs::ISymlinkFilesystem& filesystem_;
  AllocatorPolicy policy_;
};

// allocate_temp_symlink is the process-level entry point: the process-wide suffix
// generator, the POSIX filesystem and the default policy.
// Returns the path of the new symlink or the terminal error.
[[nodiscard]] core::Result<std::filesystem::path, AllocationError> allocate_temp_symlink(
    const std::string& target, const std::filesystem::path& directory);

}  // namespace linkswap::publish
