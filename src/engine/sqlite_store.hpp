#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "engine/sqlite/database.hpp"
#include "engine/store.hpp"

namespace im::engine {

struct SqliteStoreOptions {
  /// Database file; ":memory:" keeps everything in the connection.
  std::string path = "im_orchestrator.db";
  sqlite::DatabaseOptions database;
};

/// ExecutionStore on SQLite. Each mutation runs in a `BEGIN IMMEDIATE` transaction
/// that reloads the run aggregate, applies the state machine and writes back the
/// changed rows.
class SqliteExecutionStore final : public ExecutionStore {
 public:
  static auto open(SqliteStoreOptions options = {}) -> Expected<std::unique_ptr<SqliteExecutionStore>>;

  auto create_run(const RunRequest& request, const ExecutionPlan& plan) -> Expected<Run> override;
  auto load_run(RunId run_id) -> Expected<Run> override;
  auto load_tasks(RunId run_id) -> Expected<std::vector<TaskExecution>> override;
  auto load_task(TaskId task_id) -> Expected<TaskExecution> override;

  auto update_task_status(TaskId task_id, const TaskTransition& transition) -> Expected<TransitionResult> override;
  auto request_cancel(RunId run_id, std::string reason) -> Expected<TransitionResult> override;
  auto reconcile_run(RunId run_id) -> Expected<TransitionResult> override;

  auto append_log(LogEntry entry) -> Expected<LogId> override;
  auto list_logs(RunId run_id, std::optional<TaskId> task_id = std::nullopt)
    -> Expected<std::vector<LogEntry>> override;

  auto list_eligible_runs(std::size_t limit, TimePoint now, std::size_t offset = 0)
    -> Expected<std::vector<Run>> override;
  auto list_runs_past_deadline(TimePoint now) -> Expected<std::vector<RunId>> override;
  auto recover_in_flight(TimePoint now) -> Expected<std::vector<TransitionResult>> override;
  auto purge_run(RunId run_id) -> Expected<void> override;

 private:
  explicit SqliteExecutionStore(std::unique_ptr<sqlite::SqliteDatabase> db);

  std::unique_ptr<sqlite::SqliteDatabase> db_;
  std::mutex mutex_;
};

}  // namespace im::engine
