#pragma once

#include "linkswap/core/result.h"
#include "linkswap/storage/publish_record.h"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace linkswap::storage {

// IPublishJournal keeps an append-only history of completed publishes.
//
// append stores the record and returns the sequence number it was given. The
// incoming `seq` is ignored. Sequence numbers start at 1 and increase in append
// order, so both list operations return records sorted by `seq`.
class IPublishJournal {
 public:
  virtual ~IPublishJournal() = default;
  [[nodiscard]] virtual core::Result<std::int64_t, std::string> append(
      const PublishRecord& record) = 0;
  [[nodiscard]] virtual std::vector<PublishRecord> list(const std::string& link_path) const = 0;
  [[nodiscard]] virtual std::vector<PublishRecord> list_all() const = 0;
};

class InMemoryPublishJournal final : public IPublishJournal {
 public:
  [[nodiscard]] core::Result<std::int64_t, std::string> append(
      const PublishRecord& record) override;
  [[nodiscard]] std::vector<PublishRecord> list(const std::string& link_path) const override;
  [[nodiscard]] std::vector<PublishRecord> list_all() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<PublishRecord> records_;
};

}  // namespace linkswap::storage
