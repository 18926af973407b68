#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <sqlite3.h>

namespace im::engine::sqlite {

/// Raised by the wrappers below; carries the SQLite primary result code. Stores catch
/// it and translate it to an EngineError, so it never crosses the store interface.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}

  auto code() const -> int { return code_ & 0xff; }
  auto extended_code() const -> int { return code_; }

 private:
  int code_;
};

struct DatabaseOptions {
  std::chrono::milliseconds busy_timeout{5000};
  bool wal = true;
};

class SqliteDatabase {
 public:
  SqliteDatabase(const std::string& path, DatabaseOptions options = {});
  ~SqliteDatabase();

  SqliteDatabase(const SqliteDatabase&) = delete;
  auto operator=(const SqliteDatabase&) -> SqliteDatabase& = delete;

  auto get() const -> sqlite3* { return db_; }
  auto path() const -> const std::string& { return path_; }

  /// Run one or more statements without results.
  auto exec(const char* sql) const -> void;
  auto last_insert_id() const -> std::int64_t;
  auto changes() const -> int;

 private:
  sqlite3* db_ = nullptr;
  std::string path_;
};

class SqliteStmt {
 public:
  SqliteStmt(const SqliteDatabase& db, const char* sql);
  ~SqliteStmt();

  SqliteStmt(const SqliteStmt&) = delete;
  auto operator=(const SqliteStmt&) -> SqliteStmt& = delete;

  operator sqlite3_stmt*() { return stmt_; }
  auto get() -> sqlite3_stmt* { return stmt_; }

  auto bind_int64(int index, std::int64_t value) -> void;
  auto bind_double(int index, double value) -> void;
  auto bind_text(int index, std::string_view value) -> void;
  auto bind_null(int index) -> void;
  auto bind_optional(int index, std::optional<std::int64_t> value) -> void;

  /// Advance; true while a row is available.
  auto step() -> bool;
  /// Step a statement that must not return rows.
  auto run() -> void;
  auto reset() -> void;

  auto column_int64(int index) -> std::int64_t;
  auto column_double(int index) -> double;
  auto column_text(int index) -> std::string;
  auto column_optional(int index) -> std::optional<std::int64_t>;
  auto column_is_null(int index) -> bool;

 private:
  auto check_bind(int rc) -> void;

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

/// `BEGIN IMMEDIATE` on construction, rolled back on destruction unless committed.
class SqliteTransaction {
 public:
  explicit SqliteTransaction(const SqliteDatabase& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  auto operator=(const SqliteTransaction&) -> SqliteTransaction& = delete;

  auto commit() -> void;

 private:
  const SqliteDatabase& db_;
  bool done_ = false;
};

}  // namespace im::engine::sqlite
