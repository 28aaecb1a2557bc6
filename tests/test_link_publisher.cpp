#include "linkswap/fs/posix_symlink_filesystem.h"
#include "linkswap/naming/suffix_generator.h"
#include "linkswap/publish/link_publisher.h"
#include "linkswap/storage/publish_journal.h"

#include "test_doubles.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>

using namespace linkswap;

namespace {

// Journal that refuses every record.
class RejectingJournal final : public storage::IPublishJournal {
 public:
  core::Result<std::int64_t, std::string> append(
      const storage::PublishRecord& /*record*/) override {
    return core::Result<std::int64_t, std::string>::err("journal is read-only");
  }
  std::vector<storage::PublishRecord> list(const std::string& /*link_path*/) const override {
    return {};
  }
  std::vector<storage::PublishRecord> list_all() const override { return {}; }
};

std::int64_t unix_now() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::seconds>(now).count();
}

std::size_t entry_count(const std::filesystem::path& dir) {
  std::size_t n = 0;
  for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(dir)) {
    ++n;
  }
  return n;
}

}  // namespace

TEST_CASE("LinkPublisher: publishes a new link and journals it", "[publisher][posix]") {
  testing::ScratchDir scratch("publish-new");
  core::FixedSeedSource seeds(7);
  naming::LcgSuffixGenerator generator(seeds);
  auto& filesystem = fs::process_filesystem();
  publish::TempSymlinkAllocator allocator(generator, filesystem);
  storage::InMemoryPublishJournal journal;
  publish::LinkPublisher publisher(allocator, filesystem, &journal);

  const auto link = scratch.path() / "current";
  const auto before = unix_now();
  auto result = publisher.publish("releases/v1", link);
  const auto after = unix_now();
  REQUIRE(result.has_value());

  const auto& outcome = result.value();
  CHECK(outcome.link_path == link);
  CHECK(outcome.target == "releases/v1");
  CHECK_FALSE(outcome.previous_target.has_value());
  CHECK(outcome.attempts == 1);
  CHECK_FALSE(outcome.journal_error.has_value());
  REQUIRE(outcome.journal_seq.has_value());
  CHECK(outcome.journal_seq.value() == 1);
  CHECK(outcome.published_unix >= before);
  CHECK(outcome.published_unix <= after);
  CHECK(testing::is_temp_name(outcome.temp_path.filename().string()));

  CHECK(std::filesystem::read_symlink(link) == std::filesystem::path("releases/v1"));
  CHECK_FALSE(std::filesystem::exists(std::filesystem::symlink_status(outcome.temp_path)));
  CHECK(entry_count(scratch.path()) == 1);

  const auto records = journal.list(link.string());
  REQUIRE(records.size() == 1);
  CHECK(records[0].seq == 1);
  CHECK(records[0].target == "releases/v1");
  CHECK(records[0].temp_path == outcome.temp_path.string());
  CHECK(records[0].published_unix == outcome.published_unix);
  CHECK_FALSE(records[0].previous_target.has_value());
}

TEST_CASE("LinkPublisher: republishing records the previous target", "[publisher][posix]") {
  testing::ScratchDir scratch("publish-replace");
  core::SystemSeedSource seeds;
  naming::LcgSuffixGenerator generator(seeds);
  auto& filesystem = fs::process_filesystem();
  publish::TempSymlinkAllocator allocator(generator, filesystem);
  storage::InMemoryPublishJournal journal;
  publish::LinkPublisher publisher(allocator, filesystem, &journal);

  const auto link = scratch.path() / "current";
  REQUIRE(publisher.publish("v1", link).has_value());
  auto second = publisher.publish("v2", link);
  REQUIRE(second.has_value());

  REQUIRE(second.value().previous_target.has_value());
  CHECK(second.value().previous_target.value() == "v1");
  CHECK(std::filesystem::read_symlink(link) == std::filesystem::path("v2"));
  CHECK(entry_count(scratch.path()) == 1);

  const auto records = journal.list(link.string());
  REQUIRE(records.size() == 2);
  CHECK(records[0].target == "v1");
  CHECK(records[1].target == "v2");
  CHECK(records[1].previous_target.value() == "v1");
  REQUIRE(second.value().journal_seq.has_value());
  CHECK(second.value().journal_seq.value() == 2);
}

TEST_CASE("LinkPublisher: link path in the current directory", "[publisher]") {
  testing::RecordingSuffixGenerator suffixes;
  testing::ScriptedSymlinkFilesystem filesystem;
  publish::TempSymlinkAllocator allocator(suffixes, filesystem);
  publish::LinkPublisher publisher(allocator, filesystem, nullptr);

  auto result = publisher.publish("v1", "current");
  REQUIRE(result.has_value());
  CHECK(result.value().temp_path == std::filesystem::path("./symlink.000000000"));
  CHECK(filesystem.links.at("current") == "v1");
}

TEST_CASE("LinkPublisher: rename failure removes the temp link", "[publisher][posix][error]") {
  testing::ScratchDir scratch("publish-rename-fail");
  core::SystemSeedSource seeds;
  naming::LcgSuffixGenerator generator(seeds);
  auto& filesystem = fs::process_filesystem();
  publish::TempSymlinkAllocator allocator(generator, filesystem);
  storage::InMemoryPublishJournal journal;
  publish::LinkPublisher publisher(allocator, filesystem, &journal);

  // A symlink cannot be renamed over a non-empty directory.
  const auto link = scratch.path() / "occupied";
  std::filesystem::create_directories(link);
  {
    std::ofstream out(link / "file");
    out << "x";
  }

  auto result = publisher.publish("v1", link);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().stage == publish::PublishStage::kRename);
  CHECK(result.error().code);
  CHECK_FALSE(result.error().message.empty());
  CHECK(testing::is_temp_name(result.error().temp_path.filename().string()));
  CHECK_FALSE(result.error().cleanup_code);

  CHECK(entry_count(scratch.path()) == 1);
  CHECK(std::filesystem::is_directory(link));
  CHECK(journal.list_all().empty());
}

TEST_CASE("LinkPublisher: rename error survives a failed cleanup", "[publisher][error]") {
  testing::RecordingSuffixGenerator suffixes;
  testing::ScriptedSymlinkFilesystem filesystem;
  filesystem.rename_error = std::make_error_code(std::errc::cross_device_link);
  filesystem.remove_error = std::make_error_code(std::errc::permission_denied);
  publish::TempSymlinkAllocator allocator(suffixes, filesystem);
  publish::LinkPublisher publisher(allocator, filesystem, nullptr);

  auto result = publisher.publish("v1", "/srv/current");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().stage == publish::PublishStage::kRename);
  CHECK(result.error().code == std::errc::cross_device_link);
  REQUIRE(filesystem.remove_calls.size() == 1);
  CHECK(filesystem.remove_calls[0] == std::filesystem::path("/srv/symlink.000000000"));

  // The leftover link is handed back to the caller instead of being logged here.
  CHECK(result.error().temp_path == std::filesystem::path("/srv/symlink.000000000"));
  CHECK(result.error().cleanup_code == std::errc::permission_denied);
  CHECK(filesystem.links.count("/srv/symlink.000000000") == 1);
}

TEST_CASE("LinkPublisher: allocation failure is reported with its stage", "[publisher][error]") {
  testing::ScratchDir scratch("publish-alloc-fail");
  core::SystemSeedSource seeds;
  naming::LcgSuffixGenerator generator(seeds);
  auto& filesystem = fs::process_filesystem();
  publish::TempSymlinkAllocator allocator(generator, filesystem);
  publish::LinkPublisher publisher(allocator, filesystem, nullptr);

  auto result = publisher.publish("v1", scratch.path() / "missing" / "current");
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().stage == publish::PublishStage::kAllocate);
  CHECK(result.error().code == std::errc::no_such_file_or_directory);
}

TEST_CASE("LinkPublisher: journal failure does not undo the publish", "[publisher][journal]") {
  testing::RecordingSuffixGenerator suffixes;
  testing::ScriptedSymlinkFilesystem filesystem;
  publish::TempSymlinkAllocator allocator(suffixes, filesystem);
  RejectingJournal journal;
  publish::LinkPublisher publisher(allocator, filesystem, &journal);

  auto result = publisher.publish("v1", "/srv/current");
  REQUIRE(result.has_value());
  REQUIRE(result.value().journal_error.has_value());
  CHECK(result.value().journal_error.value() == "journal is read-only");
  CHECK_FALSE(result.value().journal_seq.has_value());
  CHECK(filesystem.links.at("/srv/current") == "v1");
}
