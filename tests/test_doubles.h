#pragma once

#include "linkswap/core/seed_source.h"
#include "linkswap/fs/symlink_filesystem.h"
#include "linkswap/naming/suffix_generator.h"

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace linkswap::testing {

// ScriptedSymlinkFilesystem answers create_symlink from a queue of scripted error
// codes, then falls back to `fallback_create`. Successful creates are remembered so
// rename/remove/read_symlink behave like a tiny in-memory directory tree.
class ScriptedSymlinkFilesystem final : public fs::ISymlinkFilesystem {
 public:
  std::deque<std::error_code> create_script;
  std::error_code fallback_create;
  std::error_code rename_error;
  std::error_code remove_error;

  std::vector<std::filesystem::path> create_calls;
  std::vector<std::filesystem::path> remove_calls;
  std::map<std::filesystem::path, std::string> links;

  std::error_code create_symlink(const std::string& target,
                                 const std::filesystem::path& link) override {
    create_calls.push_back(link);
    std::error_code ec = fallback_create;
    if (!create_script.empty()) {
      ec = create_script.front();
      create_script.pop_front();
    }
    if (!ec) {
      if (links.count(link) != 0) {
        return std::make_error_code(std::errc::file_exists);
      }
      links[link] = target;
    }
    return ec;
  }

  std::error_code rename(const std::filesystem::path& from,
                         const std::filesystem::path& to) override {
    if (rename_error) {
      return rename_error;
    }
    auto it = links.find(from);
    if (it == links.end()) {
      return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    links[to] = it->second;
    links.erase(from);
    return {};
  }

  std::error_code remove(const std::filesystem::path& path) override {
    remove_calls.push_back(path);
    if (remove_error) {
      return remove_error;
    }
    if (links.erase(path) == 0) {
      return std::make_error_code(std::errc::no_such_file_or_directory);
    }
    return {};
  }

  [[nodiscard]] core::Result<std::string, std::error_code> read_symlink(
      const std::filesystem::path& link) const override {
    auto it = links.find(link);
    if (it == links.end()) {
      return core::Result<std::string, std::error_code>::err(
          std::make_error_code(std::errc::no_such_file_or_directory));
    }
    return core::Result<std::string, std::error_code>::ok(it->second);
  }
};

// RecordingSuffixGenerator hands out "000000000", "000000001", ... and records the
// order of next_suffix()/reseed() calls as "next"/"reseed".
class RecordingSuffixGenerator final : public naming::ISuffixGenerator {
 public:
  std::vector<std::string> events;

  std::string next_suffix() override {
    events.emplace_back("next");
    return naming::format_suffix(counter_++);
  }

  void reseed() override { events.emplace_back("reseed"); }

  [[nodiscard]] int reseed_count() const {
    int n = 0;
    for (const auto& e : events) {
      if (e == "reseed") {
        ++n;
      }
    }
    return n;
  }

 private:
  std::uint32_t counter_{0};
};

// CountingSeedSource returns a fixed seed and counts how often it was asked.
// Not thread-safe.
class CountingSeedSource final : public core::ISeedSource {
 public:
  explicit CountingSeedSource(std::uint32_t value) : value_(value) {}

  std::uint32_t seed() override {
    ++calls;
    return value_;
  }

  int calls{0};

 private:
  std::uint32_t value_;
};

// ScratchDir creates a fresh directory under the system temp dir and removes it
// (recursively) on destruction.
class ScratchDir {
 public:
  explicit ScratchDir(const std::string& name) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("linkswap-" + name + "-" + std::to_string(::getpid()) + "-" +
             std::to_string(counter.fetch_add(1)));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;
  ScratchDir(ScratchDir&&) = delete;
  ScratchDir& operator=(ScratchDir&&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// is_temp_name checks "<prefix><9 digits>".
inline bool is_temp_name(const std::string& filename, const std::string& prefix = "symlink.") {
  if (filename.size() != prefix.size() + naming::kSuffixWidth) {
    return false;
  }
  if (filename.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  for (std::size_t i = prefix.size(); i < filename.size(); ++i) {
    if (filename[i] < '0' || filename[i] > '9') {
      return false;
    }
  }
  return true;
}

}  // namespace linkswap::testing
