#pragma once

#include "linkswap/core/result.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace linkswap::storage::sqlite {

// SqliteDb is a connection to a publish journal file.
//
// open() sets a busy timeout so several publishers can share one file, then
// applies any schema migration the file is missing inside an IMMEDIATE
// transaction. A successfully opened database is always at kSchemaVersion.
//
// The connection is not synchronized; SqlitePublishJournal serializes access.
class SqliteDb {
 public:
  static constexpr int kSchemaVersion = 1;

  // ":memory:" opens a private in-memory journal.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Highest applied migration, 0 for a file that has none.
  [[nodiscard]] int schema_version() const;

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

  // Last error reported on this connection.
  [[nodiscard]] std::string last_error() const;

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  core::Result<bool, std::string> migrate();

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// Statement owns one prepared statement. Bind indexes are 1-based, column
// indexes 0-based, as in SQLite.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  void bind_text(int index, const std::string& value);
  void bind_optional_text(int index, const std::optional<std::string>& value);  // NULL if empty
  void bind_int64(int index, std::int64_t value);

  // Returns SQLITE_ROW, SQLITE_DONE or an SQLite error code.
  int step();

  [[nodiscard]] std::string column_text(int col) const;
  [[nodiscard]] std::optional<std::string> column_optional_text(int col) const;
  [[nodiscard]] std::int64_t column_int64(int col) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace linkswap::storage::sqlite
