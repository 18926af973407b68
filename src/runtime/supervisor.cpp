#include "runtime/supervisor.hpp"

#include <thread>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "common/logging/log.hpp"
#include "engine/retry.hpp"

namespace im::engine {
namespace {

auto is_run_terminal_event(EventType type) -> bool {
  return type == EventType::RunCompleted || type == EventType::RunFailed || type == EventType::RunCancelled;
}

auto summary(const Run& run) -> std::string {
  return fmt::format("run {}: status={} tasks={}/{} retries={} duration_ms={} cost={:.4f} tokens={}", run.id,
                     to_string(run.status), run.completed_tasks, run.total_tasks, run.retry_count, run.duration_ms,
                     run.total_cost, run.tokens_used);
}

}  // namespace

RunSupervisor::RunSupervisor(ExecutionStore& store, const NodeRegistry& registry, EventPublisher& events,
                             SupervisorConfig config)
    : store_(store), registry_(registry), events_(events), config_(config) {}

auto RunSupervisor::submit(const PipelineDefinition& pipeline, const RunRequest& request) -> Expected<Run> {
  if (request.max_retries && *request.max_retries < 0) {
    return tl::unexpected(make_validation_error("INVALID_OPTIONS", "max_retries must be a non-negative integer"));
  }
  auto plan = compile_plan(pipeline, registry_, config_.compile);
  if (!plan) {
    im::log::warn("pipeline {} rejected: {} ({})", pipeline.id, plan.error().message, plan.error().code);
    return tl::unexpected(plan.error());
  }

  Expected<Run> run = tl::unexpected(make_error(ErrorKind::StoreUnavailable, "run not created"));
  {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    run = store_.create_run(request, *plan);
    if (run) {
      events_.publish(queued_event(*run));
    }
  }
  if (!run) {
    return tl::unexpected(run.error());
  }

  im::log::info("run.queued", {{"run", std::to_string(run->id)},
                               {"pipeline", run->pipeline_id},
                               {"priority", std::to_string(run->priority)},
                               {"tasks", std::to_string(run->total_tasks)}});
  log(run->id, std::nullopt, 0, LogLevel::Info, "system",
      fmt::format("run queued with {} tasks (priority {})", run->total_tasks, run->priority));
  return run;
}

template <typename Fn>
auto RunSupervisor::with_conflict_retry(Fn&& fn) -> Expected<TransitionResult> {
  for (int attempt = 0;; ++attempt) {
    Expected<TransitionResult> result = tl::unexpected(make_error(ErrorKind::StoreUnavailable, "not attempted"));
    {
      std::lock_guard<std::mutex> lock(publish_mutex_);
      result = fn();
      if (result) {
        events_.publish(result->events);
      }
    }
    if (result) {
      record_terminal(*result);
      return result;
    }
    if (result.error().kind != ErrorKind::ClaimConflict || attempt + 1 >= config_.conflict_attempts) {
      return result;
    }
    std::this_thread::sleep_for(store_backoff(attempt));
  }
}

auto RunSupervisor::record_terminal(const TransitionResult& result) -> void {
  for (const auto& event : result.events) {
    if (!is_run_terminal_event(event.type)) {
      continue;
    }
    const auto& run = result.run;
    im::log::info("run.finished", {{"run", std::to_string(run.id)},
                                   {"status", std::string(to_string(run.status))},
                                   {"duration_ms", std::to_string(run.duration_ms)},
                                   {"cost", fmt::format("{:.4f}", run.total_cost)},
                                   {"tokens", std::to_string(run.tokens_used)}});
    auto level = run.status == RunStatus::Failed ? LogLevel::Error : LogLevel::Info;
    std::string message = summary(run);
    if (!event.message.empty()) {
      message += fmt::format(" ({})", event.message);
    }
    log(run.id, std::nullopt, 0, level, "system", std::move(message));
  }
}

auto RunSupervisor::apply(TaskId task_id, const TaskTransition& transition) -> Expected<TransitionResult> {
  return with_conflict_retry([&]() { return store_.update_task_status(task_id, transition); });
}

auto RunSupervisor::cancel(RunId run_id, std::string reason) -> Expected<TransitionResult> {
  auto result = with_conflict_retry([&]() { return store_.request_cancel(run_id, reason); });
  if (result && result->changed) {
    im::log::info("run {} cancellation accepted: {}", run_id, result->run.cancel_reason);
    log(run_id, std::nullopt, 0, LogLevel::Warn, "system",
        fmt::format("cancellation requested: {}", result->run.cancel_reason));
  }
  return result;
}

auto RunSupervisor::reconcile(RunId run_id) -> Expected<TransitionResult> {
  return with_conflict_retry([&]() { return store_.reconcile_run(run_id); });
}

auto RunSupervisor::enforce_deadlines(TimePoint now) -> Expected<std::vector<RunId>> {
  auto expired = store_.list_runs_past_deadline(now);
  if (!expired) {
    return tl::unexpected(expired.error());
  }
  std::vector<RunId> cancelled;
  for (RunId run_id : *expired) {
    auto result = cancel(run_id, "run deadline exceeded");
    if (!result) {
      if (result.error().kind == ErrorKind::StoreUnavailable) {
        return tl::unexpected(result.error());
      }
      im::log::warn("deadline cancel failed for run {}: {}", run_id, result.error().message);
      continue;
    }
    if (result->changed) {
      cancelled.push_back(run_id);
    }
  }
  return cancelled;
}

auto RunSupervisor::recover(TimePoint now) -> Expected<int> {
  Expected<std::vector<TransitionResult>> results = tl::unexpected(make_error(ErrorKind::StoreUnavailable, "not attempted"));
  {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    results = store_.recover_in_flight(now);
    if (results) {
      for (const auto& result : *results) {
        events_.publish(result.events);
      }
    }
  }
  if (!results) {
    return tl::unexpected(results.error());
  }
  int recovered = 0;
  for (const auto& result : *results) {
    for (const auto& task : result.updated_tasks) {
      if (task.status == TaskStatus::Retrying) {
        recovered += 1;
        log(task.run_id, task.id, task.attempt, LogLevel::Warn, "system",
            fmt::format("task {} recovered after restart", task.node_id));
      }
    }
    record_terminal(result);
  }
  if (recovered > 0) {
    im::log::warn("recovered {} in-flight tasks", recovered);
  }
  return recovered;
}

auto RunSupervisor::log(RunId run_id, std::optional<TaskId> task_id, int attempt, LogLevel level, std::string category,
                        std::string message) -> void {
  LogEntry entry;
  entry.run_id = run_id;
  entry.task_id = task_id;
  entry.attempt = attempt;
  entry.level = level;
  entry.category = std::move(category);
  entry.message = std::move(message);
  entry.at = Clock::now();
  if (auto appended = store_.append_log(std::move(entry)); !appended) {
    im::log::warn("execution log dropped for run {}: {}", run_id, appended.error().message);
  }
}

}  // namespace im::engine
