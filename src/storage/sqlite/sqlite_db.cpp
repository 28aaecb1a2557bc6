#include "linkswap/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <utility>

namespace linkswap::storage::sqlite {

namespace {

// Several publishers may share one journal file; wait this long for their locks.
constexpr int kBusyTimeoutMillis = 5000;

struct Migration {
  int version;
  const char* sql;
};

// Migrations are applied in order; each one records itself in schema_version.
constexpr Migration kMigrations[] = {
    {1, R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_unix INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS publish_records (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  link_path TEXT NOT NULL,
  target TEXT NOT NULL,
  previous_target TEXT,
  temp_path TEXT NOT NULL,
  attempts INTEGER NOT NULL CHECK(attempts >= 1),
  conflicts INTEGER NOT NULL CHECK(conflicts >= 0),
  published_unix INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_publish_records_link ON publish_records(link_path, seq);

INSERT OR IGNORE INTO schema_version (version, applied_unix)
VALUES (1, CAST(strftime('%s', 'now') AS INTEGER));
)"},
};

constexpr int kMigrationCount = static_cast<int>(sizeof(kMigrations) / sizeof(kMigrations[0]));
static_assert(kMigrationCount == SqliteDb::kSchemaVersion, "every schema version needs a migration");

// exec_script runs one or more statements that return no rows.
core::Result<bool, std::string> exec_script(sqlite3* db, const char* sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err(error);
  }
  return core::Result<bool, std::string>::ok(true);
}

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void Statement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using ResultType = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  int rc = sqlite3_open(path.c_str(), &raw);
  // Owned from here on, including the failure path (sqlite3_open may still allocate).
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));
  if (rc != SQLITE_OK) {
    const std::string error = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    return ResultType::err("Failed to open journal " + path + ": " + error);
  }

  rc = sqlite3_busy_timeout(raw, kBusyTimeoutMillis);
  if (rc != SQLITE_OK) {
    return ResultType::err("Failed to set busy timeout on " + path + ": " + db->last_error());
  }

  auto migrated = db->migrate();
  if (!migrated.has_value()) {
    return ResultType::err("Failed to migrate journal " + path + ": " + migrated.error());
  }
  return ResultType::ok(std::move(db));
}

int SqliteDb::schema_version() const {
  Statement stmt(db_.get(), "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid()) {
    return 0;  // table not created yet
  }
  if (stmt.step() != SQLITE_ROW) {
    return 0;
  }
  return static_cast<int>(stmt.column_int64(0));
}

std::string SqliteDb::last_error() const {
  return sqlite3_errmsg(db_.get());
}

core::Result<bool, std::string> SqliteDb::migrate() {
  // Fast path without taking the write lock.
  if (schema_version() >= kSchemaVersion) {
    return core::Result<bool, std::string>::ok(true);
  }

  auto begun = exec_script(db_.get(), "BEGIN IMMEDIATE");
  if (!begun.has_value()) {
    return begun;
  }

  // Another process may have migrated while we waited for the lock.
  const int current = schema_version();
  for (const auto& migration : kMigrations) {
    if (migration.version <= current) {
      continue;
    }
    auto applied = exec_script(db_.get(), migration.sql);
    if (!applied.has_value()) {
      // The failure being reported is the migration's; a failed rollback adds nothing.
      static_cast<void>(exec_script(db_.get(), "ROLLBACK"));
      return core::Result<bool, std::string>::err("schema v" +
                                                  std::to_string(migration.version) + ": " +
                                                  applied.error());
    }
  }

  return exec_script(db_.get(), "COMMIT");
}

Statement::Statement(sqlite3* db, const char* sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql, -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void Statement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

void Statement::bind_optional_text(const int index, const std::optional<std::string>& value) {
  if (value.has_value()) {
    bind_text(index, value.value());
  } else {
    sqlite3_bind_null(stmt_.get(), index);
  }
}

void Statement::bind_int64(const int index, const std::int64_t value) {
  sqlite3_bind_int64(stmt_.get(), index, static_cast<sqlite3_int64>(value));
}

int Statement::step() {
  return sqlite3_step(stmt_.get());
}

std::string Statement::column_text(const int col) const {
  const auto* raw = sqlite3_column_text(stmt_.get(), col);
  if (raw == nullptr) {
    return "";
  }
  const int size = sqlite3_column_bytes(stmt_.get(), col);
  return {reinterpret_cast<const char*>(raw), static_cast<std::size_t>(size)};  // NOLINT
}

std::optional<std::string> Statement::column_optional_text(const int col) const {
  if (sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(col);
}

std::int64_t Statement::column_int64(const int col) const {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_.get(), col));
}

}  // namespace linkswap::storage::sqlite
