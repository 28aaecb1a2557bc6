#pragma once

#include "linkswap/core/result.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace linkswap::fs {

// ISymlinkFilesystem abstracts the OS primitives used to publish symlinks.
//
// Every mutating operation returns a std::error_code that is empty on success.
// Errors are reported in std::generic_category() so callers can compare against
// std::errc values (e.g. std::errc::file_exists).
//
// Atomicity requirements on implementations:
// - create_symlink must fail with file_exists if *any* entry already occupies the
//   path, and must never replace it. This is the only cross-process exclusion the
//   allocator relies on; a separate existence check followed by a create is not
//   acceptable.
// - rename must replace an existing destination in a single step.
class ISymlinkFilesystem {
 public:
  virtual ~ISymlinkFilesystem() = default;

  // Create a symlink at `link` whose content is exactly `target`.
  // `target` is not validated or resolved.
  virtual std::error_code create_symlink(const std::string& target,
                                         const std::filesystem::path& link) = 0;

  // Atomically move `from` onto `to`, replacing `to` if it exists.
  virtual std::error_code rename(const std::filesystem::path& from,
                                 const std::filesystem::path& to) = 0;

  // Remove a directory entry (never follows symlinks).
  virtual std::error_code remove(const std::filesystem::path& path) = 0;

  // Return the content of the symlink at `link`.
  [[nodiscard]] virtual core::Result<std::string, std::error_code> read_symlink(
      const std::filesystem::path& link) const = 0;

 protected:
  ISymlinkFilesystem() = default;
  ISymlinkFilesystem(const ISymlinkFilesystem&) = default;
  ISymlinkFilesystem& operator=(const ISymlinkFilesystem&) = default;
  ISymlinkFilesystem(ISymlinkFilesystem&&) = default;
  ISymlinkFilesystem& operator=(ISymlinkFilesystem&&) = default;
};

// is_conflict reports whether an error means "an entry already exists at that path".
[[nodiscard]] inline bool is_conflict(const std::error_code& ec) {
  return ec == std::errc::file_exists;
}

}  // namespace linkswap::fs
