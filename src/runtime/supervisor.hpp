#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "engine/error.hpp"
#include "engine/events.hpp"
#include "engine/pipeline.hpp"
#include "engine/plan.hpp"
#include "engine/registry.hpp"
#include "engine/store.hpp"

namespace im::engine {

struct SupervisorConfig {
  CompileOptions compile;
  /// Attempts for a transition that keeps hitting ClaimConflict.
  int conflict_attempts = 10;
};

/// Owns the run lifecycle on top of the store: every transition goes through here so
/// its events are published in sequence order and terminal runs get their summary log.
class RunSupervisor {
 public:
  RunSupervisor(ExecutionStore& store, const NodeRegistry& registry, EventPublisher& events,
                SupervisorConfig config = {});

  /// Compile and persist a run. Validation errors are returned before anything is stored.
  auto submit(const PipelineDefinition& pipeline, const RunRequest& request) -> Expected<Run>;

  /// Apply a task transition, retrying on ClaimConflict.
  auto apply(TaskId task_id, const TaskTransition& transition) -> Expected<TransitionResult>;
  auto cancel(RunId run_id, std::string reason) -> Expected<TransitionResult>;
  auto reconcile(RunId run_id) -> Expected<TransitionResult>;
  /// Cancel every run whose deadline has passed. Returns the ids cancelled.
  auto enforce_deadlines(TimePoint now) -> Expected<std::vector<RunId>>;
  /// Release tasks left RUNNING by a previous process.
  auto recover(TimePoint now) -> Expected<int>;

  /// Append an execution log entry; failures are reported to the process log only.
  auto log(RunId run_id, std::optional<TaskId> task_id, int attempt, LogLevel level, std::string category,
           std::string message) -> void;

 private:
  template <typename Fn>
  auto with_conflict_retry(Fn&& fn) -> Expected<TransitionResult>;
  auto record_terminal(const TransitionResult& result) -> void;

  ExecutionStore& store_;
  const NodeRegistry& registry_;
  EventPublisher& events_;
  SupervisorConfig config_;
  std::mutex publish_mutex_;
};

}  // namespace im::engine
