#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/events.hpp"
#include "engine/pipeline.hpp"
#include "engine/registry.hpp"
#include "engine/retry.hpp"
#include "engine/store.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/executor.hpp"
#include "runtime/supervisor.hpp"

namespace im::engine {

/// Configuration for the orchestrator and its worker pool.
struct OrchestratorConfig {
  /// Upper bound on tasks executing at once across all runs.
  int max_concurrent_tasks = 4;
  /// Dispatcher poll interval; cycles also run whenever a task settles.
  std::chrono::milliseconds dispatch_poll_interval{100};
  /// Eligible runs considered per dispatch cycle.
  std::size_t admission_batch = 16;
  /// Retry policy for transient task failures.
  RetryPolicyConfig retry;
  /// Per-task timeout when neither the node type nor the node config sets one.
  std::chrono::milliseconds default_task_timeout{std::chrono::minutes(5)};
  /// SQLite database path; empty keeps state in memory.
  std::string store_path;
  /// Release tasks left RUNNING by a previous process on start().
  bool recover_on_start = true;

  /// Build from the command-line flags (--max_concurrent_tasks, --store_path, ...).
  static auto from_flags() -> OrchestratorConfig;
};

/// Per-submission options.
struct SubmitOptions {
  int priority = 0;
  /// Defaults to the pipeline definition's id.
  std::string pipeline_id;
  std::string user_id;
  Json inputs = Json::object();
  std::optional<TimePoint> scheduled_for;
  /// Cancel the run when it has not finished this long after submission.
  std::optional<std::chrono::milliseconds> timeout;
  /// Retry budget for every node that does not set `max_retries` in its config.
  std::optional<int> max_retries;
};

struct RunView {
  Run run;
  std::vector<TaskExecution> tasks;
};

auto to_json(const RunView& view) -> Json;

/// High-level facade that owns the registry, store, event fan-out, worker pool and
/// dispatcher.
class Orchestrator {
 public:
  /// Construct with an explicit store (tests inject a MemoryExecutionStore).
  Orchestrator(OrchestratorConfig config, std::shared_ptr<ExecutionStore> store);
  /// Stops the dispatcher and the worker pool.
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  auto operator=(const Orchestrator&) -> Orchestrator& = delete;

  /// Open the configured store (SQLite when store_path is set) and construct.
  static auto create(OrchestratorConfig config) -> Expected<std::unique_ptr<Orchestrator>>;

  /// Node types must be registered before start().
  auto registry() -> NodeRegistry&;
  auto registry() const -> const NodeRegistry&;
  auto events() -> EventPublisher&;
  auto store() -> ExecutionStore&;

  auto start() -> Expected<void>;
  auto stop() -> void;

  /// Validate, compile and enqueue a pipeline. Nothing is persisted when it is invalid.
  auto submit(const PipelineDefinition& pipeline, const SubmitOptions& options = {}) -> Expected<RunId>;
  auto submit_json(const Json& json, const SubmitOptions& options = {}) -> Expected<RunId>;
  /// Stage a pipeline definition read from a JSON file.
  auto submit_file(std::string_view path, const SubmitOptions& options = {}) -> Expected<RunId>;

  auto cancel(RunId run_id, std::string reason = {}) -> Expected<void>;
  auto status(RunId run_id) -> Expected<RunView>;
  auto logs(RunId run_id, std::optional<TaskId> task_id = std::nullopt) -> Expected<std::vector<LogEntry>>;
  /// Delete a finished run and its tasks; its execution logs remain.
  auto purge(RunId run_id) -> Expected<void>;

  /// Block until the run is terminal or the timeout elapses.
  auto wait_for(RunId run_id, std::chrono::milliseconds timeout) -> Expected<Run>;

  auto health() const -> DispatcherHealth;
  /// Runs with a wait_for() caller blocked on them.
  auto waiting_runs() const -> std::size_t;

 private:
  class TerminalWatcher;

  OrchestratorConfig config_;
  std::shared_ptr<ExecutionStore> store_;
  NodeRegistry registry_;
  EventPublisher events_;
  std::shared_ptr<TerminalWatcher> watcher_;
  std::unique_ptr<RunSupervisor> supervisor_;
  std::unique_ptr<TaskExecutorPool> pool_;
  std::unique_ptr<Dispatcher> dispatcher_;
  bool started_ = false;
};

}  // namespace im::engine
