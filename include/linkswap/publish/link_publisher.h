#pragma once

#include "linkswap/core/result.h"
#include "linkswap/fs/symlink_filesystem.h"
#include "linkswap/publish/temp_symlink_allocator.h"
#include "linkswap/storage/publish_journal.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace linkswap::publish {

enum class PublishStage {
  kAllocate,  // no temp symlink could be created
  kRename,    // temp symlink created but could not be moved over the link path
};

struct PublishError {
  PublishStage stage{PublishStage::kAllocate};
  std::error_code code;
  std::string message;
  // kRename only: the temp symlink that was removed, or left behind if cleanup_code is set.
  std::filesystem::path temp_path;
  std::error_code cleanup_code;
};

struct PublishOutcome {
  std::filesystem::path link_path;
  std::string target;
  std::optional<std::string> previous_target;
  std::filesystem::path temp_path;
  int attempts{0};
  int conflicts{0};
  std::int64_t published_unix{0};
  std::optional<std::int64_t> journal_seq;   // set once the journal stored the record
  std::optional<std::string> journal_error;  // set if the journal rejected the record
};

// LinkPublisher atomically points a well-known path at a new target.
//
// publish(target, link_path):
//   1. allocate a temp symlink to `target` next to `link_path`
//   2. remember what `link_path` pointed to, if it is a symlink
//   3. rename the temp symlink over `link_path`
//
// Readers of `link_path` observe either the old or the new target, never a
// missing entry. If step 3 fails the temp symlink is removed and the rename
// error is returned; a failed removal is reported in PublishError::cleanup_code.
// Nothing is written to stdout or stderr.
//
// The journal is optional (nullptr = no history). A journal failure does not
// undo a completed publish; it is reported in PublishOutcome::journal_error.
class LinkPublisher {
 public:
  LinkPublisher(TempSymlinkAllocator& allocator, fs::ISymlinkFilesystem& filesystem,
                storage::IPublishJournal* journal);

  [[nodiscard]] core::Result<PublishOutcome, PublishError> publish(
      const std::string& target, const std::filesystem::path& link_path);

 private:
  TempSymlinkAllocator& allocator_;
  fs::ISymlinkFilesystem& filesystem_;
  storage::IPublishJournal* journal_;
};

}  // namespace linkswap::publish
