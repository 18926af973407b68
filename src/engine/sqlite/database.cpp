#include "engine/sqlite/database.hpp"

#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"

namespace im::engine::sqlite {

SqliteDatabase::SqliteDatabase(const std::string& path, DatabaseOptions options) : path_(path) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw SqliteError(rc, fmt::format("failed to open database {}: {}", path, message));
  }
  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, static_cast<int>(options.busy_timeout.count()));
  exec("PRAGMA foreign_keys = ON;");
  if (options.wal) {
    exec("PRAGMA journal_mode = WAL;");
    exec("PRAGMA synchronous = NORMAL;");
  }
}

SqliteDatabase::~SqliteDatabase() {
  if (db_) {
    sqlite3_close(db_);
  }
}

auto SqliteDatabase::exec(const char* sql) const -> void {
  char* errmsg = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
  if (rc != SQLITE_OK) {
    std::string message = errmsg ? errmsg : sqlite3_errmsg(db_);
    sqlite3_free(errmsg);
    throw SqliteError(rc, message);
  }
}

auto SqliteDatabase::last_insert_id() const -> std::int64_t {
  return sqlite3_last_insert_rowid(db_);
}

auto SqliteDatabase::changes() const -> int {
  return sqlite3_changes(db_);
}

SqliteStmt::SqliteStmt(const SqliteDatabase& db, const char* sql) : db_(db.get()) {
  int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    stmt_ = nullptr;
    throw SqliteError(rc, fmt::format("failed to prepare statement: {}", sqlite3_errmsg(db_)));
  }
}

SqliteStmt::~SqliteStmt() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

auto SqliteStmt::check_bind(int rc) -> void {
  if (rc != SQLITE_OK) {
    throw SqliteError(rc, fmt::format("failed to bind parameter: {}", sqlite3_errmsg(db_)));
  }
}

auto SqliteStmt::bind_int64(int index, std::int64_t value) -> void {
  check_bind(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
}

auto SqliteStmt::bind_double(int index, double value) -> void {
  check_bind(sqlite3_bind_double(stmt_, index, value));
}

auto SqliteStmt::bind_text(int index, std::string_view value) -> void {
  check_bind(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
}

auto SqliteStmt::bind_null(int index) -> void {
  check_bind(sqlite3_bind_null(stmt_, index));
}

auto SqliteStmt::bind_optional(int index, std::optional<std::int64_t> value) -> void {
  if (value) {
    bind_int64(index, *value);
  } else {
    bind_null(index);
  }
}

auto SqliteStmt::step() -> bool {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw SqliteError(rc, fmt::format("statement failed: {}", sqlite3_errmsg(db_)));
}

auto SqliteStmt::run() -> void {
  if (step()) {
    throw SqliteError(SQLITE_MISUSE, "statement unexpectedly returned rows");
  }
}

auto SqliteStmt::reset() -> void {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

auto SqliteStmt::column_int64(int index) -> std::int64_t {
  return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, index));
}

auto SqliteStmt::column_double(int index) -> double {
  return sqlite3_column_double(stmt_, index);
}

auto SqliteStmt::column_text(int index) -> std::string {
  const auto* text = sqlite3_column_text(stmt_, index);
  if (!text) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

auto SqliteStmt::column_optional(int index) -> std::optional<std::int64_t> {
  if (column_is_null(index)) {
    return std::nullopt;
  }
  return column_int64(index);
}

auto SqliteStmt::column_is_null(int index) -> bool {
  return sqlite3_column_type(stmt_, index) == SQLITE_NULL;
}

SqliteTransaction::SqliteTransaction(const SqliteDatabase& db) : db_(db) {
  db_.exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (done_) {
    return;
  }
  char* errmsg = nullptr;
  if (sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
    im::log::warn("rollback failed on {}: {}", db_.path(), errmsg ? errmsg : "unknown error");
  }
  sqlite3_free(errmsg);
}

auto SqliteTransaction::commit() -> void {
  db_.exec("COMMIT;");
  done_ = true;
}

}  // namespace im::engine::sqlite
