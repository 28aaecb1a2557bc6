#pragma once

#include "linkswap/storage/publish_journal.h"
#include "linkswap/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace linkswap::storage::sqlite {

// SqlitePublishJournal implements IPublishJournal with a SQLite backend.
// Sequence numbers come from the AUTOINCREMENT seq column, so records from
// several processes sharing one file interleave in commit order and a number
// is never reused.
class SqlitePublishJournal final : public IPublishJournal {
 public:
  explicit SqlitePublishJournal(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<std::int64_t, std::string> append(
      const PublishRecord& record) override;
  [[nodiscard]] std::vector<PublishRecord> list(const std::string& link_path) const override;
  [[nodiscard]] std::vector<PublishRecord> list_all() const override;

 private:
  std::vector<PublishRecord> query(const std::string* link_path) const;

  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;  // serializes use of the single connection
};

}  // namespace linkswap::storage::sqlite
