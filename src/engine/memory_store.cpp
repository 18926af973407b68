#include "engine/memory_store.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace im::engine {
namespace {

auto run_not_found(RunId run_id) -> EngineError {
  return make_error(ErrorKind::NotFound, fmt::format("run not found: {}", run_id), "RUN_NOT_FOUND");
}

auto eligible(const Run& run, TimePoint now) -> bool {
  if (is_terminal(run.status) || run.cancel_requested) {
    return false;
  }
  return !run.scheduled_for || *run.scheduled_for <= now;
}

}  // namespace

MemoryExecutionStore::MemoryExecutionStore(ClockFn clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = []() { return Clock::now(); };
  }
}

auto MemoryExecutionStore::set_available(bool available) -> void {
  available_.store(available, std::memory_order_release);
}

auto MemoryExecutionStore::check_available() const -> Expected<void> {
  if (!available_.load(std::memory_order_acquire)) {
    return tl::unexpected(make_error(ErrorKind::StoreUnavailable, "execution store unavailable", "STORE_UNAVAILABLE"));
  }
  return {};
}

auto MemoryExecutionStore::find_aggregate(RunId run_id) -> RunAggregate* {
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto MemoryExecutionStore::create_run(const RunRequest& request, const ExecutionPlan& plan) -> Expected<Run> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto aggregate = make_aggregate(request, plan, clock_());
  aggregate.run.id = next_run_id_++;
  aggregate.run.last_event_sequence = 1;

  std::vector<TaskId> ids;
  ids.reserve(aggregate.tasks.size());
  for (auto& task : aggregate.tasks) {
    bind_task_ids(task, ids);
    task.id = next_task_id_++;
    task.run_id = aggregate.run.id;
    ids.push_back(task.id);
    task_runs_.emplace(task.id, aggregate.run.id);
  }

  auto run = aggregate.run;
  runs_.emplace(run.id, std::move(aggregate));
  return run;
}

auto MemoryExecutionStore::load_run(RunId run_id) -> Expected<Run> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto* aggregate = find_aggregate(run_id);
  if (!aggregate) {
    return tl::unexpected(run_not_found(run_id));
  }
  return aggregate->run;
}

auto MemoryExecutionStore::load_tasks(RunId run_id) -> Expected<std::vector<TaskExecution>> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto* aggregate = find_aggregate(run_id);
  if (!aggregate) {
    return tl::unexpected(run_not_found(run_id));
  }
  return aggregate->tasks;
}

auto MemoryExecutionStore::load_task(TaskId task_id) -> Expected<TaskExecution> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = task_runs_.find(task_id);
  auto* aggregate = it == task_runs_.end() ? nullptr : find_aggregate(it->second);
  const auto* task = aggregate ? aggregate->find_task(task_id) : nullptr;
  if (!task) {
    return tl::unexpected(make_error(ErrorKind::NotFound, fmt::format("task not found: {}", task_id), "TASK_NOT_FOUND"));
  }
  return *task;
}

auto MemoryExecutionStore::update_task_status(TaskId task_id, const TaskTransition& transition)
  -> Expected<TransitionResult> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = task_runs_.find(task_id);
  if (it == task_runs_.end()) {
    return tl::unexpected(make_error(ErrorKind::NotFound, fmt::format("task not found: {}", task_id), "TASK_NOT_FOUND"));
  }
  auto* aggregate = find_aggregate(it->second);
  if (!aggregate) {
    return tl::unexpected(run_not_found(it->second));
  }
  return apply_task_transition(*aggregate, task_id, transition, clock_());
}

auto MemoryExecutionStore::request_cancel(RunId run_id, std::string reason) -> Expected<TransitionResult> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto* aggregate = find_aggregate(run_id);
  if (!aggregate) {
    return tl::unexpected(run_not_found(run_id));
  }
  return apply_cancel(*aggregate, std::move(reason), clock_());
}

auto MemoryExecutionStore::reconcile_run(RunId run_id) -> Expected<TransitionResult> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto* aggregate = find_aggregate(run_id);
  if (!aggregate) {
    return tl::unexpected(run_not_found(run_id));
  }
  return reconcile(*aggregate, clock_());
}

auto MemoryExecutionStore::append_log(LogEntry entry) -> Expected<LogId> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  entry.id = next_log_id_++;
  if (entry.at == TimePoint{}) {
    entry.at = clock_();
  }
  logs_.push_back(std::move(entry));
  return logs_.back().id;
}

auto MemoryExecutionStore::list_logs(RunId run_id, std::optional<TaskId> task_id)
  -> Expected<std::vector<LogEntry>> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LogEntry> out;
  for (const auto& entry : logs_) {
    if (entry.run_id != run_id) {
      continue;
    }
    if (task_id && entry.task_id != task_id) {
      continue;
    }
    out.push_back(entry);
  }
  return out;
}

auto MemoryExecutionStore::list_eligible_runs(std::size_t limit, TimePoint now, std::size_t offset)
  -> Expected<std::vector<Run>> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Run> out;
  for (const auto& [id, aggregate] : runs_) {
    if (eligible(aggregate.run, now)) {
      out.push_back(aggregate.run);
    }
  }
  std::sort(out.begin(), out.end(), [](const Run& lhs, const Run& rhs) {
    if (lhs.priority != rhs.priority) {
      return lhs.priority > rhs.priority;
    }
    if (lhs.queued_at != rhs.queued_at) {
      return lhs.queued_at < rhs.queued_at;
    }
    return lhs.id < rhs.id;
  });
  if (offset >= out.size()) {
    return std::vector<Run>{};
  }
  out.erase(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(offset));
  if (limit > 0 && out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

auto MemoryExecutionStore::list_runs_past_deadline(TimePoint now) -> Expected<std::vector<RunId>> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RunId> out;
  for (const auto& [id, aggregate] : runs_) {
    const auto& run = aggregate.run;
    if (!is_terminal(run.status) && !run.cancel_requested && run.deadline && *run.deadline <= now) {
      out.push_back(id);
    }
  }
  return out;
}

auto MemoryExecutionStore::recover_in_flight(TimePoint now) -> Expected<std::vector<TransitionResult>> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TransitionResult> out;
  for (auto& [id, aggregate] : runs_) {
    auto result = apply_recover(aggregate, now);
    if (result.changed) {
      out.push_back(std::move(result));
    }
  }
  return out;
}

auto MemoryExecutionStore::purge_run(RunId run_id) -> Expected<void> {
  if (auto ok = check_available(); !ok) {
    return tl::unexpected(ok.error());
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = runs_.find(run_id);
  if (it == runs_.end()) {
    return tl::unexpected(run_not_found(run_id));
  }
  if (!is_terminal(it->second.run.status)) {
    return tl::unexpected(make_error(ErrorKind::InvalidTransition,
                                     fmt::format("run {} is still {}", run_id, to_string(it->second.run.status)),
                                     "RUN_ACTIVE"));
  }
  for (const auto& task : it->second.tasks) {
    task_runs_.erase(task.id);
  }
  runs_.erase(it);
  return {};
}

}  // namespace im::engine
