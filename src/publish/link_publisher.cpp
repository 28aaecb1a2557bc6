#include "linkswap/publish/link_publisher.h"

#include <chrono>
#include <utility>

namespace linkswap::publish {

namespace {

std::int64_t unix_seconds_now() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

}  // namespace

LinkPublisher::LinkPublisher(TempSymlinkAllocator& allocator, fs::ISymlinkFilesystem& filesystem,
                             storage::IPublishJournal* journal)
    : allocator_(allocator), filesystem_(filesystem), journal_(journal) {}

core::Result<PublishOutcome, PublishError> LinkPublisher::publish(
    const std::string& target, const std::filesystem::path& link_path) {
  using ResultType = core::Result<PublishOutcome, PublishError>;

  // The temp link must live in the same directory so the rename stays on one filesystem.
  std::filesystem::path directory = link_path.parent_path();
  if (directory.empty()) {
    directory = ".";
  }

  auto allocated = allocator_.allocate(target, directory);
  if (!allocated.has_value()) {
    const auto& err = allocated.error();
    return ResultType::err(PublishError{
        .stage = PublishStage::kAllocate,
        .code = err.code,
        .message = err.message(),
    });
  }
  const TempSymlink& temp = allocated.value();

  std::optional<std::string> previous_target;
  const auto previous = filesystem_.read_symlink(link_path);
  if (previous.has_value()) {
    previous_target = previous.value();
  }

  const std::error_code rename_ec = filesystem_.rename(temp.path, link_path);
  if (rename_ec) {
    return ResultType::err(PublishError{
        .stage = PublishStage::kRename,
        .code = rename_ec,
        .message = "cannot rename " + temp.path.string() + " over " + link_path.string() + ": " +
                   rename_ec.message(),
        .temp_path = temp.path,
        .cleanup_code = filesystem_.remove(temp.path),
    });
  }

  PublishOutcome outcome{
      .link_path = link_path,
      .target = target,
      .previous_target = previous_target,
      .temp_path = temp.path,
      .attempts = temp.attempts,
      .conflicts = temp.conflicts,
      .published_unix = unix_seconds_now(),
      .journal_seq = std::nullopt,
      .journal_error = std::nullopt,
  };

  if (journal_ != nullptr) {
    const storage::PublishRecord record{
        .seq = 0,
        .link_path = link_path.string(),
        .target = target,
        .previous_target = previous_target,
        .temp_path = temp.path.string(),
        .attempts = temp.attempts,
        .conflicts = temp.conflicts,
        .published_unix = outcome.published_unix,
    };
    auto appended = journal_->append(record);
    if (appended.has_value()) {
      outcome.journal_seq = appended.value();
    } else {
      outcome.journal_error = appended.error();
    }
  }

  return ResultType::ok(std::move(outcome));
}

}  // namespace linkswap::publish
