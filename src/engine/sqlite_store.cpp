#include "engine/sqlite_store.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"

namespace im::engine {
namespace {

using sqlite::SqliteDatabase;
using sqlite::SqliteError;
using sqlite::SqliteStmt;
using sqlite::SqliteTransaction;

constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS pipeline_runs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  pipeline_id TEXT NOT NULL,
  user_id TEXT NOT NULL DEFAULT '',
  status TEXT NOT NULL,
  priority INTEGER NOT NULL DEFAULT 0,
  queued_at INTEGER NOT NULL,
  scheduled_for INTEGER,
  started_at INTEGER,
  completed_at INTEGER,
  deadline INTEGER,
  progress REAL NOT NULL DEFAULT 0,
  total_tasks INTEGER NOT NULL DEFAULT 0,
  completed_tasks INTEGER NOT NULL DEFAULT 0,
  retry_count INTEGER NOT NULL DEFAULT 0,
  total_cost REAL NOT NULL DEFAULT 0,
  tokens_used INTEGER NOT NULL DEFAULT 0,
  duration_ms INTEGER NOT NULL DEFAULT 0,
  cancel_requested INTEGER NOT NULL DEFAULT 0,
  cancel_reason TEXT NOT NULL DEFAULT '',
  error TEXT NOT NULL DEFAULT '',
  inputs TEXT NOT NULL DEFAULT '{}',
  last_event_sequence INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_runs_dispatch ON pipeline_runs(status, priority DESC, queued_at);

CREATE TABLE IF NOT EXISTS task_executions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  run_id INTEGER NOT NULL REFERENCES pipeline_runs(id) ON DELETE CASCADE,
  node_id TEXT NOT NULL,
  node_type TEXT NOT NULL,
  execution_order INTEGER NOT NULL,
  depends_on TEXT NOT NULL DEFAULT '[]',
  inputs TEXT NOT NULL DEFAULT '[]',
  config TEXT NOT NULL DEFAULT '{}',
  status TEXT NOT NULL,
  attempt INTEGER NOT NULL DEFAULT 0,
  max_retries INTEGER NOT NULL DEFAULT 0,
  critical INTEGER NOT NULL DEFAULT 1,
  retryable INTEGER NOT NULL DEFAULT 1,
  timeout_ms INTEGER NOT NULL DEFAULT 0,
  started_at INTEGER,
  finished_at INTEGER,
  retry_at INTEGER,
  error TEXT NOT NULL DEFAULT '',
  error_kind TEXT,
  output TEXT,
  cost REAL NOT NULL DEFAULT 0,
  tokens_used INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_tasks_run_order ON task_executions(run_id, execution_order);
CREATE INDEX IF NOT EXISTS idx_tasks_status ON task_executions(status);

CREATE TABLE IF NOT EXISTS execution_logs (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  run_id INTEGER NOT NULL,
  task_id INTEGER,
  attempt INTEGER NOT NULL DEFAULT 0,
  level TEXT NOT NULL,
  category TEXT NOT NULL DEFAULT 'system',
  message TEXT NOT NULL,
  at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_logs_run ON execution_logs(run_id, task_id, id);
)sql";

constexpr const char* kRunColumns =
  "id, pipeline_id, user_id, status, priority, queued_at, scheduled_for, started_at, completed_at, deadline, "
  "progress, total_tasks, completed_tasks, retry_count, total_cost, tokens_used, duration_ms, cancel_requested, "
  "cancel_reason, error, inputs, last_event_sequence";

constexpr const char* kTaskColumns =
  "id, run_id, node_id, node_type, execution_order, depends_on, inputs, config, status, attempt, max_retries, "
  "critical, retryable, timeout_ms, started_at, finished_at, retry_at, error, error_kind, output, cost, tokens_used";

auto to_engine_error(const SqliteError& error) -> EngineError {
  switch (error.code()) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return make_error(ErrorKind::ClaimConflict, error.what(), "STORE_CONFLICT");
    default:
      return make_error(ErrorKind::StoreUnavailable, error.what(), "STORE_UNAVAILABLE");
  }
}

auto corrupt(std::string message) -> SqliteError {
  return SqliteError(SQLITE_CORRUPT, std::move(message));
}

auto optional_millis(const std::optional<TimePoint>& tp) -> std::optional<std::int64_t> {
  if (!tp) {
    return std::nullopt;
  }
  return to_millis(*tp);
}

auto optional_time(std::optional<std::int64_t> ms) -> std::optional<TimePoint> {
  if (!ms) {
    return std::nullopt;
  }
  return from_millis(*ms);
}

/// Node outputs may carry raw provider bytes; invalid UTF-8 is stored as U+FFFD.
auto column_json(const Json& json) -> std::string {
  return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

auto parse_column_json(const std::string& text, Json fallback) -> Json {
  if (text.empty()) {
    return fallback;
  }
  auto json = Json::parse(text, nullptr, false);
  if (json.is_discarded()) {
    throw corrupt(fmt::format("invalid JSON column: {}", text));
  }
  return json;
}

template <typename T>
auto unwrap(Expected<T> value) -> T {
  if (!value) {
    throw corrupt(value.error().message);
  }
  return std::move(*value);
}

auto encode_inputs(const std::vector<InputBinding>& inputs) -> std::string {
  Json array = Json::array();
  for (const auto& input : inputs) {
    array.push_back({{"target", input.target_handle}, {"source", input.source_task}, {"sourceHandle", input.source_handle}});
  }
  return column_json(array);
}

auto decode_inputs(const Json& array) -> std::vector<InputBinding> {
  std::vector<InputBinding> inputs;
  for (const auto& item : array) {
    inputs.push_back(InputBinding{item.value("target", std::string()), item.value("source", TaskId{0}),
                                  item.value("sourceHandle", std::string())});
  }
  return inputs;
}

auto read_run(SqliteStmt& stmt) -> Run {
  Run run;
  run.id = stmt.column_int64(0);
  run.pipeline_id = stmt.column_text(1);
  run.user_id = stmt.column_text(2);
  run.status = unwrap(parse_run_status(stmt.column_text(3)));
  run.priority = static_cast<int>(stmt.column_int64(4));
  run.queued_at = from_millis(stmt.column_int64(5));
  run.scheduled_for = optional_time(stmt.column_optional(6));
  run.started_at = optional_time(stmt.column_optional(7));
  run.completed_at = optional_time(stmt.column_optional(8));
  run.deadline = optional_time(stmt.column_optional(9));
  run.progress = stmt.column_double(10);
  run.total_tasks = static_cast<int>(stmt.column_int64(11));
  run.completed_tasks = static_cast<int>(stmt.column_int64(12));
  run.retry_count = static_cast<int>(stmt.column_int64(13));
  run.total_cost = stmt.column_double(14);
  run.tokens_used = stmt.column_int64(15);
  run.duration_ms = stmt.column_int64(16);
  run.cancel_requested = stmt.column_int64(17) != 0;
  run.cancel_reason = stmt.column_text(18);
  run.error = stmt.column_text(19);
  run.inputs = parse_column_json(stmt.column_text(20), Json::object());
  run.last_event_sequence = static_cast<std::uint64_t>(stmt.column_int64(21));
  return run;
}

auto read_task(SqliteStmt& stmt) -> TaskExecution {
  TaskExecution task;
  task.id = stmt.column_int64(0);
  task.run_id = stmt.column_int64(1);
  task.node_id = stmt.column_text(2);
  task.node_type = stmt.column_text(3);
  task.execution_order = static_cast<int>(stmt.column_int64(4));
  for (const auto& dependency : parse_column_json(stmt.column_text(5), Json::array())) {
    task.depends_on.push_back(dependency.get<TaskId>());
  }
  task.inputs = decode_inputs(parse_column_json(stmt.column_text(6), Json::array()));
  task.config = parse_column_json(stmt.column_text(7), Json::object());
  task.status = unwrap(parse_task_status(stmt.column_text(8)));
  task.attempt = static_cast<int>(stmt.column_int64(9));
  task.max_retries = static_cast<int>(stmt.column_int64(10));
  task.critical = stmt.column_int64(11) != 0;
  task.retryable = stmt.column_int64(12) != 0;
  task.timeout = std::chrono::milliseconds(stmt.column_int64(13));
  task.started_at = optional_time(stmt.column_optional(14));
  task.finished_at = optional_time(stmt.column_optional(15));
  task.retry_at = optional_time(stmt.column_optional(16));
  task.error = stmt.column_text(17);
  if (!stmt.column_is_null(18)) {
    task.error_kind = unwrap(parse_error_kind(stmt.column_text(18)));
  }
  if (!stmt.column_is_null(19)) {
    task.output = parse_column_json(stmt.column_text(19), Json());
  }
  task.cost = stmt.column_double(20);
  task.tokens_used = stmt.column_int64(21);
  return task;
}

auto read_log(SqliteStmt& stmt) -> LogEntry {
  LogEntry entry;
  entry.id = stmt.column_int64(0);
  entry.run_id = stmt.column_int64(1);
  entry.task_id = stmt.column_optional(2);
  entry.attempt = static_cast<int>(stmt.column_int64(3));
  entry.level = unwrap(parse_log_level(stmt.column_text(4)));
  entry.category = stmt.column_text(5);
  entry.message = stmt.column_text(6);
  entry.at = from_millis(stmt.column_int64(7));
  return entry;
}

/// Binds parameters 1-21 in kRunColumns order, skipping `id`.
auto bind_run(SqliteStmt& stmt, const Run& run) -> void {
  stmt.bind_text(1, run.pipeline_id);
  stmt.bind_text(2, run.user_id);
  stmt.bind_text(3, to_string(run.status));
  stmt.bind_int64(4, run.priority);
  stmt.bind_int64(5, to_millis(run.queued_at));
  stmt.bind_optional(6, optional_millis(run.scheduled_for));
  stmt.bind_optional(7, optional_millis(run.started_at));
  stmt.bind_optional(8, optional_millis(run.completed_at));
  stmt.bind_optional(9, optional_millis(run.deadline));
  stmt.bind_double(10, run.progress);
  stmt.bind_int64(11, run.total_tasks);
  stmt.bind_int64(12, run.completed_tasks);
  stmt.bind_int64(13, run.retry_count);
  stmt.bind_double(14, run.total_cost);
  stmt.bind_int64(15, run.tokens_used);
  stmt.bind_int64(16, run.duration_ms);
  stmt.bind_int64(17, run.cancel_requested ? 1 : 0);
  stmt.bind_text(18, run.cancel_reason);
  stmt.bind_text(19, run.error);
  stmt.bind_text(20, column_json(run.inputs));
  stmt.bind_int64(21, static_cast<std::int64_t>(run.last_event_sequence));
}

auto bind_task(SqliteStmt& stmt, const TaskExecution& task) -> void {
  stmt.bind_int64(1, task.run_id);
  stmt.bind_text(2, task.node_id);
  stmt.bind_text(3, task.node_type);
  stmt.bind_int64(4, task.execution_order);
  stmt.bind_text(5, column_json(Json(task.depends_on)));
  stmt.bind_text(6, encode_inputs(task.inputs));
  stmt.bind_text(7, column_json(task.config));
  stmt.bind_text(8, to_string(task.status));
  stmt.bind_int64(9, task.attempt);
  stmt.bind_int64(10, task.max_retries);
  stmt.bind_int64(11, task.critical ? 1 : 0);
  stmt.bind_int64(12, task.retryable ? 1 : 0);
  stmt.bind_int64(13, task.timeout.count());
  stmt.bind_optional(14, optional_millis(task.started_at));
  stmt.bind_optional(15, optional_millis(task.finished_at));
  stmt.bind_optional(16, optional_millis(task.retry_at));
  stmt.bind_text(17, task.error);
  if (task.error_kind) {
    stmt.bind_text(18, to_string(*task.error_kind));
  } else {
    stmt.bind_null(18);
  }
  if (task.output.is_null()) {
    stmt.bind_null(19);
  } else {
    stmt.bind_text(19, column_json(task.output));
  }
  stmt.bind_double(20, task.cost);
  stmt.bind_int64(21, task.tokens_used);
}

auto insert_run(const SqliteDatabase& db, const Run& run) -> RunId {
  SqliteStmt stmt(db,
                  "INSERT INTO pipeline_runs(pipeline_id, user_id, status, priority, queued_at, scheduled_for, "
                  "started_at, completed_at, deadline, progress, total_tasks, completed_tasks, retry_count, "
                  "total_cost, tokens_used, duration_ms, cancel_requested, cancel_reason, error, inputs, "
                  "last_event_sequence) VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
  bind_run(stmt, run);
  stmt.run();
  return db.last_insert_id();
}

auto update_run(const SqliteDatabase& db, const Run& run) -> void {
  SqliteStmt stmt(db,
                  "UPDATE pipeline_runs SET pipeline_id = ?, user_id = ?, status = ?, priority = ?, queued_at = ?, "
                  "scheduled_for = ?, started_at = ?, completed_at = ?, deadline = ?, progress = ?, total_tasks = ?, "
                  "completed_tasks = ?, retry_count = ?, total_cost = ?, tokens_used = ?, duration_ms = ?, "
                  "cancel_requested = ?, cancel_reason = ?, error = ?, inputs = ?, last_event_sequence = ? "
                  "WHERE id = ?;");
  bind_run(stmt, run);
  stmt.bind_int64(22, run.id);
  stmt.run();
}

auto insert_task(const SqliteDatabase& db, const TaskExecution& task) -> TaskId {
  SqliteStmt stmt(db,
                  "INSERT INTO task_executions(run_id, node_id, node_type, execution_order, depends_on, inputs, "
                  "config, status, attempt, max_retries, critical, retryable, timeout_ms, started_at, finished_at, "
                  "retry_at, error, error_kind, output, cost, tokens_used) "
                  "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
  bind_task(stmt, task);
  stmt.run();
  return db.last_insert_id();
}

auto update_task(const SqliteDatabase& db, const TaskExecution& task) -> void {
  SqliteStmt stmt(db,
                  "UPDATE task_executions SET run_id = ?, node_id = ?, node_type = ?, execution_order = ?, "
                  "depends_on = ?, inputs = ?, config = ?, status = ?, attempt = ?, max_retries = ?, critical = ?, "
                  "retryable = ?, timeout_ms = ?, started_at = ?, finished_at = ?, retry_at = ?, error = ?, "
                  "error_kind = ?, output = ?, cost = ?, tokens_used = ? WHERE id = ?;");
  bind_task(stmt, task);
  stmt.bind_int64(22, task.id);
  stmt.run();
}

auto select_run(const SqliteDatabase& db, RunId run_id) -> std::optional<Run> {
  auto sql = fmt::format("SELECT {} FROM pipeline_runs WHERE id = ?;", kRunColumns);
  SqliteStmt stmt(db, sql.c_str());
  stmt.bind_int64(1, run_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return read_run(stmt);
}

auto select_tasks(const SqliteDatabase& db, RunId run_id) -> std::vector<TaskExecution> {
  auto sql = fmt::format("SELECT {} FROM task_executions WHERE run_id = ? ORDER BY execution_order, id;", kTaskColumns);
  SqliteStmt stmt(db, sql.c_str());
  stmt.bind_int64(1, run_id);
  std::vector<TaskExecution> tasks;
  while (stmt.step()) {
    tasks.push_back(read_task(stmt));
  }
  return tasks;
}

auto select_task_run(const SqliteDatabase& db, TaskId task_id) -> std::optional<RunId> {
  SqliteStmt stmt(db, "SELECT run_id FROM task_executions WHERE id = ?;");
  stmt.bind_int64(1, task_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return stmt.column_int64(0);
}

auto select_aggregate(const SqliteDatabase& db, RunId run_id) -> std::optional<RunAggregate> {
  auto run = select_run(db, run_id);
  if (!run) {
    return std::nullopt;
  }
  RunAggregate aggregate;
  aggregate.run = std::move(*run);
  aggregate.tasks = select_tasks(db, run_id);
  return aggregate;
}

auto persist(const SqliteDatabase& db, const TransitionResult& result) -> void {
  if (!result.changed) {
    return;
  }
  update_run(db, result.run);
  for (const auto& task : result.updated_tasks) {
    update_task(db, task);
  }
}

auto run_not_found(RunId run_id) -> EngineError {
  return make_error(ErrorKind::NotFound, fmt::format("run not found: {}", run_id), "RUN_NOT_FOUND");
}

auto task_not_found(TaskId task_id) -> EngineError {
  return make_error(ErrorKind::NotFound, fmt::format("task not found: {}", task_id), "TASK_NOT_FOUND");
}

/// Runs `fn` under the connection lock. With `write` set, `fn` executes inside an
/// immediate transaction that is committed only when it returns a value.
template <typename Fn>
auto guarded(std::mutex& mutex, const SqliteDatabase& db, bool write, Fn&& fn) -> decltype(fn()) {
  std::lock_guard<std::mutex> lock(mutex);
  try {
    if (!write) {
      return fn();
    }
    SqliteTransaction transaction(db);
    auto result = fn();
    if (result) {
      transaction.commit();
    }
    return result;
  } catch (const SqliteError& error) {
    im::log::warn("sqlite store error ({}): {}", db.path(), error.what());
    return tl::unexpected(to_engine_error(error));
  } catch (const Json::exception& error) {
    im::log::error("sqlite store JSON error ({}): {}", db.path(), error.what());
    return tl::unexpected(make_error(ErrorKind::StoreUnavailable, error.what(), "STORE_CORRUPT"));
  }
}

}  // namespace

SqliteExecutionStore::SqliteExecutionStore(std::unique_ptr<sqlite::SqliteDatabase> db) : db_(std::move(db)) {}

auto SqliteExecutionStore::open(SqliteStoreOptions options) -> Expected<std::unique_ptr<SqliteExecutionStore>> {
  try {
    auto db = std::make_unique<SqliteDatabase>(options.path, options.database);
    db->exec(kSchema);
    im::log::info("execution store opened: {}", options.path);
    return std::unique_ptr<SqliteExecutionStore>(new SqliteExecutionStore(std::move(db)));
  } catch (const SqliteError& error) {
    return tl::unexpected(to_engine_error(error));
  }
}

auto SqliteExecutionStore::create_run(const RunRequest& request, const ExecutionPlan& plan) -> Expected<Run> {
  return guarded(mutex_, *db_, true, [&]() -> Expected<Run> {
    auto aggregate = make_aggregate(request, plan, Clock::now());
    aggregate.run.last_event_sequence = 1;
    aggregate.run.id = insert_run(*db_, aggregate.run);

    std::vector<TaskId> ids;
    ids.reserve(aggregate.tasks.size());
    for (auto& task : aggregate.tasks) {
      bind_task_ids(task, ids);
      task.run_id = aggregate.run.id;
      task.id = insert_task(*db_, task);
      ids.push_back(task.id);
    }
    return aggregate.run;
  });
}

auto SqliteExecutionStore::load_run(RunId run_id) -> Expected<Run> {
  return guarded(mutex_, *db_, false, [&]() -> Expected<Run> {
    auto run = select_run(*db_, run_id);
    if (!run) {
      return tl::unexpected(run_not_found(run_id));
    }
    return std::move(*run);
  });
}

auto SqliteExecutionStore::load_tasks(RunId run_id) -> Expected<std::vector<TaskExecution>> {
  return guarded(mutex_, *db_, false, [&]() -> Expected<std::vector<TaskExecution>> {
    if (!select_run(*db_, run_id)) {
      return tl::unexpected(run_not_found(run_id));
    }
    return select_tasks(*db_, run_id);
  });
}

auto SqliteExecutionStore::load_task(TaskId task_id) -> Expected<TaskExecution> {
  return guarded(mutex_, *db_, false, [&]() -> Expected<TaskExecution> {
    auto sql = fmt::format("SELECT {} FROM task_executions WHERE id = ?;", kTaskColumns);
    SqliteStmt stmt(*db_, sql.c_str());
    stmt.bind_int64(1, task_id);
    if (!stmt.step()) {
      return tl::unexpected(task_not_found(task_id));
    }
    return read_task(stmt);
  });
}

auto SqliteExecutionStore::update_task_status(TaskId task_id, const TaskTransition& transition)
  -> Expected<TransitionResult> {
  return guarded(mutex_, *db_, true, [&]() -> Expected<TransitionResult> {
    auto run_id = select_task_run(*db_, task_id);
    if (!run_id) {
      return tl::unexpected(task_not_found(task_id));
    }
    auto aggregate = select_aggregate(*db_, *run_id);
    if (!aggregate) {
      return tl::unexpected(run_not_found(*run_id));
    }
    auto result = apply_task_transition(*aggregate, task_id, transition, Clock::now());
    if (!result) {
      return tl::unexpected(result.error());
    }
    persist(*db_, *result);
    return result;
  });
}

auto SqliteExecutionStore::request_cancel(RunId run_id, std::string reason) -> Expected<TransitionResult> {
  return guarded(mutex_, *db_, true, [&]() -> Expected<TransitionResult> {
    auto aggregate = select_aggregate(*db_, run_id);
    if (!aggregate) {
      return tl::unexpected(run_not_found(run_id));
    }
    auto result = apply_cancel(*aggregate, std::move(reason), Clock::now());
    persist(*db_, result);
    return result;
  });
}

auto SqliteExecutionStore::reconcile_run(RunId run_id) -> Expected<TransitionResult> {
  return guarded(mutex_, *db_, true, [&]() -> Expected<TransitionResult> {
    auto aggregate = select_aggregate(*db_, run_id);
    if (!aggregate) {
      return tl::unexpected(run_not_found(run_id));
    }
    auto result = reconcile(*aggregate, Clock::now());
    persist(*db_, result);
    return result;
  });
}

auto SqliteExecutionStore::append_log(LogEntry entry) -> Expected<LogId> {
  return guarded(mutex_, *db_, false, [&]() -> Expected<LogId> {
    SqliteStmt stmt(*db_,
                    "INSERT INTO execution_logs(run_id, task_id, attempt, level, category, message, at) "
                    "VALUES(?, ?, ?, ?, ?, ?, ?);");
    stmt.bind_int64(1, entry.run_id);
    stmt.bind_optional(2, entry.task_id);
    stmt.bind_int64(3, entry.attempt);
    stmt.bind_text(4, to_string(entry.level));
    stmt.bind_text(5, entry.category);
    stmt.bind_text(6, entry.message);
    stmt.bind_int64(7, to_millis(entry.at == TimePoint{} ? Clock::now() : entry.at));
    stmt.run();
    return db_->last_insert_id();
  });
}

auto SqliteExecutionStore::list_logs(RunId run_id, std::optional<TaskId> task_id) -> Expected<std::vector<LogEntry>> {
  return guarded(mutex_, *db_, false, [&]() -> Expected<std::vector<LogEntry>> {
    SqliteStmt stmt(*db_,
                    "SELECT id, run_id, task_id, attempt, level, category, message, at FROM execution_logs "
                    "WHERE run_id = ? AND (? IS NULL OR task_id = ?) ORDER BY id;");
    stmt.bind_int64(1, run_id);
    stmt.bind_optional(2, task_id);
    stmt.bind_optional(3, task_id);
    std::vector<LogEntry> entries;
    while (stmt.step()) {
      entries.push_back(read_log(stmt));
    }
    return entries;
  });
}

auto SqliteExecutionStore::list_eligible_runs(std::size_t limit, TimePoint now, std::size_t offset)
  -> Expected<std::vector<Run>> {
  return guarded(mutex_, *db_, false, [&]() -> Expected<std::vector<Run>> {
    auto sql = fmt::format(
      "SELECT {} FROM pipeline_runs WHERE status IN ('QUEUED', 'RUNNING') AND cancel_requested = 0 "
      "AND (scheduled_for IS NULL OR scheduled_for <= ?) ORDER BY priority DESC, queued_at ASC, id ASC LIMIT ? OFFSET ?;",
      kRunColumns);
    SqliteStmt stmt(*db_, sql.c_str());
    stmt.bind_int64(1, to_millis(now));
    stmt.bind_int64(2, limit > 0 ? static_cast<std::int64_t>(limit) : -1);
    stmt.bind_int64(3, static_cast<std::int64_t>(offset));
    std::vector<Run> runs;
    while (stmt.step()) {
      runs.push_back(read_run(stmt));
    }
    return runs;
  });
}

auto SqliteExecutionStore::list_runs_past_deadline(TimePoint now) -> Expected<std::vector<RunId>> {
  return guarded(mutex_, *db_, false, [&]() -> Expected<std::vector<RunId>> {
    SqliteStmt stmt(*db_,
                    "SELECT id FROM pipeline_runs WHERE status IN ('QUEUED', 'RUNNING') AND cancel_requested = 0 "
                    "AND deadline IS NOT NULL AND deadline <= ? ORDER BY id;");
    stmt.bind_int64(1, to_millis(now));
    std::vector<RunId> ids;
    while (stmt.step()) {
      ids.push_back(stmt.column_int64(0));
    }
    return ids;
  });
}

auto SqliteExecutionStore::recover_in_flight(TimePoint now) -> Expected<std::vector<TransitionResult>> {
  return guarded(mutex_, *db_, true, [&]() -> Expected<std::vector<TransitionResult>> {
    std::vector<RunId> run_ids;
    {
      SqliteStmt stmt(*db_, "SELECT DISTINCT run_id FROM task_executions WHERE status = 'RUNNING' ORDER BY run_id;");
      while (stmt.step()) {
        run_ids.push_back(stmt.column_int64(0));
      }
    }
    std::vector<TransitionResult> results;
    for (RunId run_id : run_ids) {
      auto aggregate = select_aggregate(*db_, run_id);
      if (!aggregate) {
        continue;
      }
      auto result = apply_recover(*aggregate, now);
      persist(*db_, result);
      if (result.changed) {
        results.push_back(std::move(result));
      }
    }
    return results;
  });
}

auto SqliteExecutionStore::purge_run(RunId run_id) -> Expected<void> {
  return guarded(mutex_, *db_, true, [&]() -> Expected<void> {
    auto run = select_run(*db_, run_id);
    if (!run) {
      return tl::unexpected(run_not_found(run_id));
    }
    if (!is_terminal(run->status)) {
      return tl::unexpected(make_error(ErrorKind::InvalidTransition,
                                       fmt::format("run {} is still {}", run_id, to_string(run->status)),
                                       "RUN_ACTIVE"));
    }
    SqliteStmt tasks(*db_, "DELETE FROM task_executions WHERE run_id = ?;");
    tasks.bind_int64(1, run_id);
    tasks.run();
    SqliteStmt runs(*db_, "DELETE FROM pipeline_runs WHERE id = ?;");
    runs.bind_int64(1, run_id);
    runs.run();
    return {};
  });
}

}  // namespace im::engine
