#include "linkswap/storage/sqlite/sqlite_publish_journal.h"

#include <sqlite3.h>

#include <utility>

namespace linkswap::storage::sqlite {

namespace {

constexpr const char* kInsertSql = R"(
  INSERT INTO publish_records
    (link_path, target, previous_target, temp_path, attempts, conflicts, published_unix)
  VALUES (?, ?, ?, ?, ?, ?, ?)
)";

constexpr const char* kSelectAllSql = R"(
  SELECT seq, link_path, target, previous_target, temp_path, attempts, conflicts, published_unix
    FROM publish_records
   ORDER BY seq
)";

constexpr const char* kSelectLinkSql = R"(
  SELECT seq, link_path, target, previous_target, temp_path, attempts, conflicts, published_unix
    FROM publish_records
   WHERE link_path = ?
   ORDER BY seq
)";

PublishRecord read_row(const Statement& stmt) {
  PublishRecord record;
  record.seq = stmt.column_int64(0);
  record.link_path = stmt.column_text(1);
  record.target = stmt.column_text(2);
  record.previous_target = stmt.column_optional_text(3);
  record.temp_path = stmt.column_text(4);
  record.attempts = static_cast<int>(stmt.column_int64(5));
  record.conflicts = static_cast<int>(stmt.column_int64(6));
  record.published_unix = stmt.column_int64(7);
  return record;
}

}  // namespace

SqlitePublishJournal::SqlitePublishJournal(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

core::Result<std::int64_t, std::string> SqlitePublishJournal::append(
    const PublishRecord& record) {
  using ResultType = core::Result<std::int64_t, std::string>;
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_->connection(), kInsertSql);
  if (!stmt.is_valid()) {
    return ResultType::err("Failed to prepare insert: " + stmt.error());
  }

  stmt.bind_text(1, record.link_path);
  stmt.bind_text(2, record.target);
  stmt.bind_optional_text(3, record.previous_target);
  stmt.bind_text(4, record.temp_path);
  stmt.bind_int64(5, record.attempts);
  stmt.bind_int64(6, record.conflicts);
  stmt.bind_int64(7, record.published_unix);

  if (stmt.step() != SQLITE_DONE) {
    return ResultType::err("Failed to append publish record: " + db_->last_error());
  }
  // seq is the rowid alias, so this is the sequence number just assigned.
  return ResultType::ok(static_cast<std::int64_t>(sqlite3_last_insert_rowid(db_->connection())));
}

std::vector<PublishRecord> SqlitePublishJournal::list(const std::string& link_path) const {
  return query(&link_path);
}

std::vector<PublishRecord> SqlitePublishJournal::list_all() const {
  return query(nullptr);
}

std::vector<PublishRecord> SqlitePublishJournal::query(const std::string* link_path) const {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement stmt(db_->connection(), link_path != nullptr ? kSelectLinkSql : kSelectAllSql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (link_path != nullptr) {
    stmt.bind_text(1, *link_path);
  }

  std::vector<PublishRecord> result;
  while (stmt.step() == SQLITE_ROW) {
    result.push_back(read_row(stmt));
  }
  return result;
}

}  // namespace linkswap::storage::sqlite
