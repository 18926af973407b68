#include "engine/state_machine.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace im::engine {
namespace {

auto invalid_transition(const TaskExecution& task, std::string_view action) -> EngineError {
  return make_error(ErrorKind::InvalidTransition,
                    fmt::format("cannot {} task {} ({}) in status {}", action, task.id, task.node_id,
                                to_string(task.status)),
                    "INVALID_TRANSITION");
}

/// Collects the side effects of one operation on an aggregate.
struct TransitionBuilder {
  RunAggregate& aggregate;
  TimePoint now;
  TransitionResult result;
  std::set<std::size_t> touched;

  auto index_of(const TaskExecution& task) const -> std::size_t {
    return static_cast<std::size_t>(&task - aggregate.tasks.data());
  }

  auto touch(const TaskExecution& task) -> void {
    touched.insert(index_of(task));
    result.changed = true;
  }

  auto emit(EventType type, const TaskExecution* task, std::string message = {}) -> void {
    Event event;
    event.run_id = aggregate.run.id;
    event.sequence = ++aggregate.run.last_event_sequence;
    event.type = type;
    if (task) {
      event.task_id = task->id;
      event.node_id = task->node_id;
      event.attempt = task->attempt;
    }
    event.progress = aggregate.run.progress;
    event.message = std::move(message);
    event.at = now;
    result.events.push_back(std::move(event));
    result.changed = true;
  }

  auto skip(TaskExecution& task, std::string reason) -> void {
    task.status = TaskStatus::Skipped;
    task.finished_at = now;
    task.retry_at.reset();
    if (task.error.empty()) {
      task.error = reason;
    }
    touch(task);
    refresh_progress();
    emit(EventType::TaskSkipped, &task, std::move(reason));
  }

  auto refresh_progress() -> void {
    auto& run = aggregate.run;
    int completed = 0;
    for (const auto& task : aggregate.tasks) {
      if (is_terminal(task.status)) {
        completed += 1;
      }
    }
    run.total_tasks = static_cast<int>(aggregate.tasks.size());
    run.completed_tasks = completed;
    run.progress = run.total_tasks > 0 ? static_cast<double>(completed) / static_cast<double>(run.total_tasks) : 1.0;
  }

  auto depends_on(const TaskExecution& task, TaskId id) const -> bool {
    return std::find(task.depends_on.begin(), task.depends_on.end(), id) != task.depends_on.end();
  }

  /// Promote PENDING dependents of `task` whose dependencies are now all satisfied.
  auto unblock_dependents(const TaskExecution& task) -> void {
    if (aggregate.run.cancel_requested) {
      return;
    }
    for (auto& candidate : aggregate.tasks) {
      if (candidate.status != TaskStatus::Pending || !depends_on(candidate, task.id)) {
        continue;
      }
      if (dependencies_satisfied(aggregate, candidate)) {
        candidate.status = TaskStatus::Ready;
        touch(candidate);
      }
    }
  }

  /// Skip every task downstream of a critical failure.
  auto cascade_skip(const TaskExecution& failed) -> void {
    std::vector<TaskId> frontier{failed.id};
    while (!frontier.empty()) {
      TaskId current = frontier.back();
      frontier.pop_back();
      for (auto& candidate : aggregate.tasks) {
        if (is_terminal(candidate.status) || !depends_on(candidate, current)) {
          continue;
        }
        skip(candidate, fmt::format("upstream task {} failed", failed.node_id));
        frontier.push_back(candidate.id);
      }
    }
  }

  auto has_active_tasks() const -> bool {
    return std::any_of(aggregate.tasks.begin(), aggregate.tasks.end(), [](const TaskExecution& task) {
      return !is_terminal(task.status);
    });
  }

  /// Move the run to its terminal status once no task can make progress.
  auto finalize() -> void {
    auto& run = aggregate.run;
    if (is_terminal(run.status) || has_active_tasks()) {
      return;
    }

    const TaskExecution* first_failure = nullptr;
    for (const auto& task : aggregate.tasks) {
      if (task.status == TaskStatus::Failed) {
        first_failure = &task;
        break;
      }
    }

    EventType type = EventType::RunCompleted;
    std::string message;
    if (run.cancel_requested) {
      run.status = RunStatus::Cancelled;
      type = EventType::RunCancelled;
      message = run.cancel_reason;
    } else if (first_failure) {
      run.status = RunStatus::Failed;
      type = EventType::RunFailed;
      run.error = fmt::format("task {} failed: {}", first_failure->node_id, first_failure->error);
      message = run.error;
    } else {
      run.status = RunStatus::Completed;
    }

    run.completed_at = now;
    auto started = run.started_at.value_or(run.queued_at);
    run.duration_ms = std::max<std::int64_t>(
      0, std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count());
    refresh_progress();
    emit(type, nullptr, std::move(message));
  }

  auto finish() -> TransitionResult {
    result.run = aggregate.run;
    result.updated_tasks.reserve(touched.size());
    for (auto index : touched) {
      result.updated_tasks.push_back(aggregate.tasks[index]);
    }
    return std::move(result);
  }
};

auto check_owned(const TaskExecution& task, const TaskTransition& transition, std::string_view action)
  -> Expected<void> {
  if (task.status != TaskStatus::Running) {
    return tl::unexpected(invalid_transition(task, action));
  }
  if (transition.attempt != 0 && transition.attempt != task.attempt) {
    return tl::unexpected(make_error(
      ErrorKind::InvalidTransition,
      fmt::format("task {} attempt {} is no longer current (now {})", task.id, transition.attempt, task.attempt),
      "STALE_ATTEMPT"));
  }
  return {};
}

}  // namespace

auto RunAggregate::find_task(TaskId id) -> TaskExecution* {
  for (auto& task : tasks) {
    if (task.id == id) {
      return &task;
    }
  }
  return nullptr;
}

auto RunAggregate::find_task(TaskId id) const -> const TaskExecution* {
  for (const auto& task : tasks) {
    if (task.id == id) {
      return &task;
    }
  }
  return nullptr;
}

auto to_string(TransitionKind kind) -> std::string_view {
  switch (kind) {
    case TransitionKind::Claim:
      return "claim";
    case TransitionKind::Succeed:
      return "succeed";
    case TransitionKind::ScheduleRetry:
      return "schedule_retry";
    case TransitionKind::Requeue:
      return "requeue";
    case TransitionKind::Fail:
      return "fail";
    case TransitionKind::Abandon:
      return "abandon";
  }
  return "unknown";
}

auto TaskTransition::claim() -> TaskTransition {
  return TaskTransition{};
}

auto TaskTransition::succeed(int attempt, Json output, double cost, std::int64_t tokens_used) -> TaskTransition {
  TaskTransition transition;
  transition.kind = TransitionKind::Succeed;
  transition.attempt = attempt;
  transition.output = std::move(output);
  transition.cost = cost;
  transition.tokens_used = tokens_used;
  return transition;
}

auto TaskTransition::schedule_retry(int attempt, TimePoint retry_at, std::string error, ErrorKind kind)
  -> TaskTransition {
  TaskTransition transition;
  transition.kind = TransitionKind::ScheduleRetry;
  transition.attempt = attempt;
  transition.retry_at = retry_at;
  transition.error = std::move(error);
  transition.error_kind = kind;
  return transition;
}

auto TaskTransition::requeue() -> TaskTransition {
  TaskTransition transition;
  transition.kind = TransitionKind::Requeue;
  return transition;
}

auto TaskTransition::fail(int attempt, std::string error, ErrorKind kind) -> TaskTransition {
  TaskTransition transition;
  transition.kind = TransitionKind::Fail;
  transition.attempt = attempt;
  transition.error = std::move(error);
  transition.error_kind = kind;
  return transition;
}

auto TaskTransition::abandon(int attempt) -> TaskTransition {
  TaskTransition transition;
  transition.kind = TransitionKind::Abandon;
  transition.attempt = attempt;
  return transition;
}

auto make_aggregate(const RunRequest& request, const ExecutionPlan& plan, TimePoint now) -> RunAggregate {
  RunAggregate aggregate;
  auto& run = aggregate.run;
  run.pipeline_id = request.pipeline_id.empty() ? plan.pipeline_id : request.pipeline_id;
  run.user_id = request.user_id;
  run.status = RunStatus::Queued;
  run.priority = request.priority;
  run.queued_at = now;
  run.scheduled_for = request.scheduled_for;
  run.deadline = request.deadline;
  run.inputs = request.inputs.is_null() ? Json::object() : request.inputs;
  run.total_tasks = static_cast<int>(plan.tasks.size());

  aggregate.tasks.reserve(plan.tasks.size());
  for (const auto& spec : plan.tasks) {
    TaskExecution task;
    task.id = spec.index;
    task.node_id = spec.node_id;
    task.node_type = spec.node_type;
    task.execution_order = spec.index;
    task.config = spec.config;
    for (int dependency : spec.depends_on) {
      task.depends_on.push_back(dependency);
    }
    for (const auto& input : spec.inputs) {
      task.inputs.push_back(InputBinding{input.target_handle, input.source_task, input.source_handle});
    }
    task.status = spec.depends_on.empty() ? TaskStatus::Ready : TaskStatus::Pending;
    task.max_retries =
      request.max_retries && !spec.max_retries_configured ? *request.max_retries : spec.max_retries;
    task.critical = spec.critical;
    task.retryable = spec.retryable;
    task.timeout = spec.timeout;
    aggregate.tasks.push_back(std::move(task));
  }
  return aggregate;
}

auto bind_task_ids(TaskExecution& task, const std::vector<TaskId>& ids) -> void {
  for (auto& dependency : task.depends_on) {
    dependency = ids.at(static_cast<std::size_t>(dependency));
  }
  for (auto& input : task.inputs) {
    input.source_task = ids.at(static_cast<std::size_t>(input.source_task));
  }
}

auto queued_event(const Run& run) -> Event {
  Event event;
  event.run_id = run.id;
  event.sequence = 1;
  event.type = EventType::RunQueued;
  event.progress = run.progress;
  event.at = run.queued_at;
  return event;
}

auto dependencies_satisfied(const RunAggregate& aggregate, const TaskExecution& task) -> bool {
  for (TaskId dependency : task.depends_on) {
    const auto* upstream = aggregate.find_task(dependency);
    if (!upstream) {
      return false;
    }
    if (upstream->status != TaskStatus::Succeeded && upstream->status != TaskStatus::Skipped) {
      return false;
    }
  }
  return true;
}

auto apply_task_transition(RunAggregate& aggregate, TaskId task_id, const TaskTransition& transition, TimePoint now)
  -> Expected<TransitionResult> {
  auto* task = aggregate.find_task(task_id);
  if (!task) {
    return tl::unexpected(
      make_error(ErrorKind::NotFound, fmt::format("task {} not found in run {}", task_id, aggregate.run.id)));
  }
  auto& run = aggregate.run;
  if (is_terminal(run.status)) {
    return tl::unexpected(make_error(ErrorKind::InvalidTransition,
                                     fmt::format("run {} is already {}", run.id, to_string(run.status)),
                                     "RUN_TERMINAL"));
  }

  TransitionBuilder builder{aggregate, now, {}, {}};

  switch (transition.kind) {
    case TransitionKind::Claim: {
      if (task->status != TaskStatus::Ready) {
        return tl::unexpected(invalid_transition(*task, "claim"));
      }
      if (run.cancel_requested) {
        return tl::unexpected(make_error(ErrorKind::InvalidTransition,
                                         fmt::format("run {} is being cancelled", run.id), "RUN_CANCELLING"));
      }
      if (run.status == RunStatus::Queued) {
        run.status = RunStatus::Running;
        run.started_at = now;
        builder.emit(EventType::RunStarted, nullptr);
      }
      task->status = TaskStatus::Running;
      task->attempt += 1;
      task->started_at = now;
      task->finished_at.reset();
      task->retry_at.reset();
      builder.touch(*task);
      builder.emit(EventType::TaskStarted, task);
      break;
    }
    case TransitionKind::Requeue: {
      if (task->status != TaskStatus::Retrying || run.cancel_requested) {
        return tl::unexpected(invalid_transition(*task, "requeue"));
      }
      if (task->retry_at && *task->retry_at > now) {
        return tl::unexpected(make_error(ErrorKind::InvalidTransition,
                                         fmt::format("task {} is not due for retry yet", task->id), "NOT_DUE"));
      }
      task->status = TaskStatus::Ready;
      task->retry_at.reset();
      builder.touch(*task);
      break;
    }
    case TransitionKind::Succeed: {
      if (auto owned = check_owned(*task, transition, "complete"); !owned) {
        return tl::unexpected(owned.error());
      }
      task->cost = transition.cost;
      task->tokens_used = transition.tokens_used;
      run.total_cost += transition.cost;
      run.tokens_used += transition.tokens_used;
      if (run.cancel_requested) {
        builder.skip(*task, "run cancelled");
        break;
      }
      task->status = TaskStatus::Succeeded;
      task->finished_at = now;
      task->output = transition.output.is_null() ? Json::object() : transition.output;
      task->error.clear();
      task->error_kind.reset();
      builder.touch(*task);
      builder.refresh_progress();
      builder.emit(EventType::TaskCompleted, task);
      builder.unblock_dependents(*task);
      break;
    }
    case TransitionKind::ScheduleRetry: {
      if (auto owned = check_owned(*task, transition, "retry"); !owned) {
        return tl::unexpected(owned.error());
      }
      task->error = transition.error;
      task->error_kind = transition.error_kind;
      if (run.cancel_requested) {
        builder.skip(*task, "run cancelled");
        break;
      }
      task->status = TaskStatus::Retrying;
      task->finished_at = now;
      task->retry_at = transition.retry_at.value_or(now);
      run.retry_count += 1;
      builder.touch(*task);
      builder.emit(EventType::TaskRetrying, task, transition.error);
      break;
    }
    case TransitionKind::Fail: {
      if (auto owned = check_owned(*task, transition, "fail"); !owned) {
        return tl::unexpected(owned.error());
      }
      task->error = transition.error;
      task->error_kind = transition.error_kind;
      if (run.cancel_requested) {
        builder.skip(*task, "run cancelled");
        break;
      }
      if (!task->critical) {
        builder.skip(*task, transition.error);
        builder.unblock_dependents(*task);
        break;
      }
      task->status = TaskStatus::Failed;
      task->finished_at = now;
      builder.touch(*task);
      builder.refresh_progress();
      builder.emit(EventType::TaskFailed, task, transition.error);
      builder.cascade_skip(*task);
      break;
    }
    case TransitionKind::Abandon: {
      if (auto owned = check_owned(*task, transition, "abandon"); !owned) {
        return tl::unexpected(owned.error());
      }
      builder.skip(*task, run.cancel_requested ? "run cancelled" : "abandoned");
      break;
    }
  }

  builder.refresh_progress();
  builder.finalize();
  return builder.finish();
}

auto apply_cancel(RunAggregate& aggregate, std::string reason, TimePoint now) -> TransitionResult {
  auto& run = aggregate.run;
  TransitionBuilder builder{aggregate, now, {}, {}};
  if (is_terminal(run.status) || run.cancel_requested) {
    return builder.finish();
  }

  run.cancel_requested = true;
  run.cancel_reason = reason.empty() ? std::string("cancelled by user") : std::move(reason);
  builder.result.changed = true;
  for (auto& task : aggregate.tasks) {
    if (task.status == TaskStatus::Pending || task.status == TaskStatus::Ready ||
        task.status == TaskStatus::Retrying) {
      builder.skip(task, "run cancelled");
    }
  }
  builder.refresh_progress();
  builder.finalize();
  return builder.finish();
}

auto apply_recover(RunAggregate& aggregate, TimePoint now) -> TransitionResult {
  TransitionBuilder builder{aggregate, now, {}, {}};
  if (is_terminal(aggregate.run.status)) {
    return builder.finish();
  }
  for (auto& task : aggregate.tasks) {
    if (task.status != TaskStatus::Running) {
      continue;
    }
    if (aggregate.run.cancel_requested) {
      builder.skip(task, "run cancelled");
      continue;
    }
    task.status = TaskStatus::Retrying;
    task.retry_at = now;
    task.finished_at = now;
    task.error = "worker lost during execution";
    task.error_kind = ErrorKind::TransientTask;
    builder.touch(task);
    builder.emit(EventType::TaskRetrying, &task, task.error);
  }
  builder.refresh_progress();
  builder.finalize();
  return builder.finish();
}

auto reconcile(RunAggregate& aggregate, TimePoint now) -> TransitionResult {
  TransitionBuilder builder{aggregate, now, {}, {}};
  if (is_terminal(aggregate.run.status)) {
    return builder.finish();
  }
  builder.finalize();
  return builder.finish();
}

}  // namespace im::engine
