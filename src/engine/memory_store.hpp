#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "engine/store.hpp"

namespace im::engine {

/// In-process store guarded by a single mutex. Used by tests, benchmarks and the
/// example CLI when no database path is configured.
class MemoryExecutionStore final : public ExecutionStore {
 public:
  using ClockFn = std::function<TimePoint()>;

  explicit MemoryExecutionStore(ClockFn clock = {});

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

  /// Simulate an outage: while unavailable every call fails with StoreUnavailable.
  auto set_available(bool available) -> void;

 private:
  auto check_available() const -> Expected<void>;
  auto find_aggregate(RunId run_id) -> RunAggregate*;

  ClockFn clock_;
  std::atomic<bool> available_{true};
  mutable std::mutex mutex_;
  std::map<RunId, RunAggregate> runs_;
  std::unordered_map<TaskId, RunId> task_runs_;
  std::vector<LogEntry> logs_;
  RunId next_run_id_ = 1;
  TaskId next_task_id_ = 1;
  LogId next_log_id_ = 1;
};

}  // namespace im::engine
