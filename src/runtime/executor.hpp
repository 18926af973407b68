#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "engine/node.hpp"
#include "engine/registry.hpp"
#include "engine/retry.hpp"
#include "engine/store.hpp"
#include "runtime/supervisor.hpp"

namespace im::engine {

struct ExecutorConfig {
  int workers = 4;
  /// Backoff bounds while persisting a result against an unavailable store.
  std::chrono::milliseconds persist_backoff_base{10};
  std::chrono::milliseconds persist_backoff_max{std::chrono::seconds(2)};
};

/// Fixed pool of workers that claim, execute and settle tasks handed over by the
/// dispatcher.
class TaskExecutorPool {
 public:
  TaskExecutorPool(ExecutorConfig config, ExecutionStore& store, const NodeRegistry& registry,
                   RunSupervisor& supervisor, RetryPolicy retry);
  ~TaskExecutorPool();

  TaskExecutorPool(const TaskExecutorPool&) = delete;
  auto operator=(const TaskExecutorPool&) -> TaskExecutorPool& = delete;

  auto start() -> void;
  /// Stop accepting work and wait for the workers to exit. Node calls still running
  /// are cancelled and their tasks stay RUNNING until recovered. The pool can be
  /// started again afterwards.
  auto stop() -> void;

  /// Queue a READY task. Returns false when it is already in flight or the pool is stopped.
  auto submit(const TaskExecution& task) -> bool;
  auto in_flight() const -> int;
  auto is_in_flight(TaskId task_id) const -> bool;
  /// Block until nothing is queued or executing.
  auto wait_idle() -> void;

  /// Trip the cancellation tokens of every in-flight task of a run.
  auto signal_cancel(RunId run_id) -> void;

  /// Called after each task settles; the dispatcher uses it to start its next cycle.
  auto set_on_settled(std::function<void()> callback) -> void;

 private:
  struct Pools;
  struct WorkQueue;
  struct NodeCall;

  auto worker_loop() -> void;
  auto execute(const TaskExecution& task) -> void;
  /// Empty when the attempt was left RUNNING because the pool is stopping.
  auto run_attempt(const TaskExecution& task, const CancellationToken& base) -> std::optional<TaskTransition>;
  auto resolve_inputs(const TaskExecution& task, Json& inputs, Json& run_inputs) -> Expected<void>;
  auto await_call(NodeCall& call, const CancellationToken& token) -> bool;
  auto settle(const TaskExecution& task, const TaskTransition& transition) -> void;
  auto finish(TaskId task_id) -> void;

  ExecutorConfig config_;
  ExecutionStore& store_;
  const NodeRegistry& registry_;
  RunSupervisor& supervisor_;
  RetryPolicy retry_;

  std::unique_ptr<WorkQueue> queue_;
  std::unique_ptr<Pools> pools_;
  std::atomic<int> alive_{0};
  std::atomic<bool> started_{false};
  std::atomic<bool> stopping_{false};

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  struct InFlight {
    RunId run_id = 0;
    CancellationToken token;
  };
  std::unordered_map<TaskId, InFlight> in_flight_;
  std::function<void()> on_settled_;
};

}  // namespace im::engine
