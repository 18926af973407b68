#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/plan.hpp"
#include "engine/state_machine.hpp"
#include "engine/types.hpp"

namespace im::engine {

/// Persistence collaborator for runs, tasks and execution logs.
///
/// Every mutation is atomic: a task transition loads the run aggregate, applies the
/// state machine and writes the result in one transaction, so two workers can never
/// both claim a task. Contention is reported as ErrorKind::ClaimConflict and an
/// unreachable backend as ErrorKind::StoreUnavailable; callers retry both with backoff.
class ExecutionStore {
 public:
  virtual ~ExecutionStore() = default;

  /// Persist a QUEUED run and its tasks. Returns the run with ids assigned.
  virtual auto create_run(const RunRequest& request, const ExecutionPlan& plan) -> Expected<Run> = 0;
  virtual auto load_run(RunId run_id) -> Expected<Run> = 0;
  /// Tasks of a run ordered by execution_order.
  virtual auto load_tasks(RunId run_id) -> Expected<std::vector<TaskExecution>> = 0;
  virtual auto load_task(TaskId task_id) -> Expected<TaskExecution> = 0;

  virtual auto update_task_status(TaskId task_id, const TaskTransition& transition) -> Expected<TransitionResult> = 0;
  virtual auto request_cancel(RunId run_id, std::string reason) -> Expected<TransitionResult> = 0;
  virtual auto reconcile_run(RunId run_id) -> Expected<TransitionResult> = 0;

  virtual auto append_log(LogEntry entry) -> Expected<LogId> = 0;
  virtual auto list_logs(RunId run_id, std::optional<TaskId> task_id = std::nullopt)
    -> Expected<std::vector<LogEntry>> = 0;

  /// Non-terminal, not cancelling runs whose scheduled time has come, ordered by
  /// priority (highest first), then queue time, then id. `offset` skips that many runs
  /// of the ordering, so callers can page past runs with nothing to dispatch.
  virtual auto list_eligible_runs(std::size_t limit, TimePoint now, std::size_t offset = 0)
    -> Expected<std::vector<Run>> = 0;
  virtual auto list_runs_past_deadline(TimePoint now) -> Expected<std::vector<RunId>> = 0;
  /// Release tasks a previous process left RUNNING.
  virtual auto recover_in_flight(TimePoint now) -> Expected<std::vector<TransitionResult>> = 0;
  /// Delete a run and its tasks. Execution logs are kept.
  virtual auto purge_run(RunId run_id) -> Expected<void> = 0;
};

}  // namespace im::engine
