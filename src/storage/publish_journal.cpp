#include "linkswap/storage/publish_journal.h"

#include <utility>

namespace linkswap::storage {

core::Result<std::int64_t, std::string> InMemoryPublishJournal::append(
    const PublishRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  PublishRecord stored = record;
  stored.seq = static_cast<std::int64_t>(records_.size()) + 1;
  records_.push_back(std::move(stored));
  return core::Result<std::int64_t, std::string>::ok(records_.back().seq);
}

std::vector<PublishRecord> InMemoryPublishJournal::list(const std::string& link_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PublishRecord> result;
  for (const auto& record : records_) {
    if (record.link_path == link_path) {
      result.push_back(record);
    }
  }
  return result;
}

std::vector<PublishRecord> InMemoryPublishJournal::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

}  // namespace linkswap::storage
