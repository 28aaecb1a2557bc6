#pragma once

#include "linkswap/fs/symlink_filesystem.h"

namespace linkswap::fs {

// PosixSymlinkFilesystem implements ISymlinkFilesystem with symlink(2), rename(2),
// unlink(2) and readlink(2). symlink(2) fails with EEXIST without touching an existing
// entry, and rename(2) within one filesystem replaces the destination atomically.
//
// Stateless and thread-safe.
class PosixSymlinkFilesystem final : public ISymlinkFilesystem {
 public:
  PosixSymlinkFilesystem() = default;
  ~PosixSymlinkFilesystem() override = default;

  PosixSymlinkFilesystem(const PosixSymlinkFilesystem&) = default;
  PosixSymlinkFilesystem& operator=(const PosixSymlinkFilesystem&) = default;
  PosixSymlinkFilesystem(PosixSymlinkFilesystem&&) = default;
  PosixSymlinkFilesystem& operator=(PosixSymlinkFilesystem&&) = default;

  std::error_code create_symlink(const std::string& target,
                                 const std::filesystem::path& link) override;
  std::error_code rename(const std::filesystem::path& from,
                         const std::filesystem::path& to) override;
  std::error_code remove(const std::filesystem::path& path) override;
  [[nodiscard]] core::Result<std::string, std::error_code> read_symlink(
      const std::filesystem::path& link) const override;
};

// process_filesystem returns a shared stateless POSIX filesystem instance.
PosixSymlinkFilesystem& process_filesystem();

}  // namespace linkswap::fs
