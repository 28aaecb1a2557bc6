#include "linkswap/fs/posix_symlink_filesystem.h"

#include <cerrno>
#include <cstdio>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

namespace linkswap::fs {

namespace {

std::error_code last_error() {
  return {errno, std::generic_category()};
}

}  // namespace

std::error_code PosixSymlinkFilesystem::create_symlink(const std::string& target,
                                                       const std::filesystem::path& link) {
  if (::symlink(target.c_str(), link.c_str()) != 0) {
    return last_error();
  }
  return {};
}

std::error_code PosixSymlinkFilesystem::rename(const std::filesystem::path& from,
                                               const std::filesystem::path& to) {
  if (std::rename(from.c_str(), to.c_str()) != 0) {
    return last_error();
  }
  return {};
}

std::error_code PosixSymlinkFilesystem::remove(const std::filesystem::path& path) {
  if (::unlink(path.c_str()) != 0) {
    return last_error();
  }
  return {};
}

core::Result<std::string, std::error_code> PosixSymlinkFilesystem::read_symlink(
    const std::filesystem::path& link) const {
  using ResultType = core::Result<std::string, std::error_code>;

  struct stat info {};
  if (::lstat(link.c_str(), &info) != 0) {
    return ResultType::err(last_error());
  }
  if (!S_ISLNK(info.st_mode)) {
    return ResultType::err(std::make_error_code(std::errc::invalid_argument));
  }

  // st_size is the target length for symlinks, but some filesystems report 0;
  // grow the buffer until readlink no longer fills it.
  std::size_t capacity = info.st_size > 0 ? static_cast<std::size_t>(info.st_size) + 1 : 256;
  for (;;) {
    std::vector<char> buffer(capacity);
    const ssize_t n = ::readlink(link.c_str(), buffer.data(), buffer.size());
    if (n < 0) {
      return ResultType::err(last_error());
    }
    if (static_cast<std::size_t>(n) < buffer.size()) {
      return ResultType::ok(std::string(buffer.data(), static_cast<std::size_t>(n)));
    }
    capacity *= 2;
  }
}

PosixSymlinkFilesystem& process_filesystem() {
  static PosixSymlinkFilesystem filesystem;
  return filesystem;
}

}  // namespace linkswap::fs
