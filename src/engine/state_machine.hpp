#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/events.hpp"
#include "engine/plan.hpp"
#include "engine/types.hpp"

namespace im::engine {

/// Parameters of a run submission.
struct RunRequest {
  std::string pipeline_id;
  std::string user_id;
  int priority = 0;
  Json inputs = Json::object();
  /// The run is not dispatched before this time.
  std::optional<TimePoint> scheduled_for;
  /// The run is cancelled once this time has passed.
  std::optional<TimePoint> deadline;
  /// Replaces the node type's retry budget for tasks whose config sets none.
  std::optional<int> max_retries;
};

/// A run together with all of its tasks, ordered by execution_order.
struct RunAggregate {
  Run run;
  std::vector<TaskExecution> tasks;

  auto find_task(TaskId id) -> TaskExecution*;
  auto find_task(TaskId id) const -> const TaskExecution*;
};

enum class TransitionKind {
  /// READY -> RUNNING, exclusive; starts a new attempt.
  Claim,
  /// RUNNING -> SUCCEEDED.
  Succeed,
  /// RUNNING -> RETRYING until retry_at.
  ScheduleRetry,
  /// RETRYING -> READY once retry_at has passed.
  Requeue,
  /// RUNNING -> FAILED, or SKIPPED for optional node types.
  Fail,
  /// RUNNING -> SKIPPED; the result of a cancelled run is discarded.
  Abandon,
};

auto to_string(TransitionKind kind) -> std::string_view;

struct TaskTransition {
  TransitionKind kind = TransitionKind::Claim;
  /// Attempt the caller owns; zero accepts any attempt.
  int attempt = 0;
  Json output;
  double cost = 0.0;
  std::int64_t tokens_used = 0;
  std::string error;
  std::optional<ErrorKind> error_kind;
  std::optional<TimePoint> retry_at;

  static auto claim() -> TaskTransition;
  static auto succeed(int attempt, Json output, double cost = 0.0, std::int64_t tokens_used = 0) -> TaskTransition;
  static auto schedule_retry(int attempt, TimePoint retry_at, std::string error, ErrorKind kind) -> TaskTransition;
  static auto requeue() -> TaskTransition;
  static auto fail(int attempt, std::string error, ErrorKind kind) -> TaskTransition;
  static auto abandon(int attempt) -> TaskTransition;
};

struct TransitionResult {
  /// False when the request was a no-op (e.g. re-finalizing a terminal run).
  bool changed = false;
  Run run;
  std::vector<TaskExecution> updated_tasks;
  std::vector<Event> events;
};

/// Materialize a compiled plan as a QUEUED run. Task ids and dependency references are
/// plan indices until the store calls bind_task_ids.
auto make_aggregate(const RunRequest& request, const ExecutionPlan& plan, TimePoint now) -> RunAggregate;

/// Rewrite a task's dependency references from plan indices to the persisted ids of
/// the tasks before it.
auto bind_task_ids(TaskExecution& task, const std::vector<TaskId>& ids) -> void;

/// The RunQueued event for a freshly created run.
auto queued_event(const Run& run) -> Event;

/// Apply one task transition and everything it implies: dependency unblocking, failure
/// cascade, progress, and run finalization. On error the aggregate is unchanged.
auto apply_task_transition(RunAggregate& aggregate, TaskId task_id, const TaskTransition& transition, TimePoint now)
  -> Expected<TransitionResult>;

/// Accept a cancellation request. Cancelling a terminal or already-cancelling run is a no-op.
auto apply_cancel(RunAggregate& aggregate, std::string reason, TimePoint now) -> TransitionResult;

/// Move tasks stranded in RUNNING by a previous process to RETRYING, due immediately.
auto apply_recover(RunAggregate& aggregate, TimePoint now) -> TransitionResult;

/// Re-evaluate the run's status from its tasks. Idempotent once terminal.
auto reconcile(RunAggregate& aggregate, TimePoint now) -> TransitionResult;

/// A task's dependencies are satisfied when each one succeeded or was skipped. Tasks
/// downstream of a critical failure are skipped before this is evaluated.
auto dependencies_satisfied(const RunAggregate& aggregate, const TaskExecution& task) -> bool;

}  // namespace im::engine
