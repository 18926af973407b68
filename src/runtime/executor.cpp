#include "runtime/executor.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <optional>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <exec/static_thread_pool.hpp>
#include <spdlog/fmt/fmt.h>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace im::engine {
namespace {

auto describe(const EngineError& error) -> std::string {
  if (error.code.empty()) {
    return error.message;
  }
  return fmt::format("{}: {}", error.code, error.message);
}

auto find_updated(const TransitionResult& result, TaskId task_id) -> const TaskExecution* {
  for (const auto& task : result.updated_tasks) {
    if (task.id == task_id) {
      return &task;
    }
  }
  return nullptr;
}

}  // namespace

struct TaskExecutorPool::WorkQueue {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<TaskExecution> items;
  bool stopped = false;

  auto push(TaskExecution item) -> void {
    {
      std::lock_guard<std::mutex> lock(mutex);
      items.push_back(std::move(item));
    }
    cv.notify_one();
  }

  /// Queued items are dropped on stop; their tasks stay READY in the store.
  auto pop(TaskExecution& out) -> bool {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [&]() { return stopped || !items.empty(); });
    if (stopped) {
      return false;
    }
    out = std::move(items.front());
    items.pop_front();
    return true;
  }

  auto stop() -> void {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (stopped) {
        return;
      }
      stopped = true;
      items.clear();
    }
    cv.notify_all();
  }

  auto reopen() -> void {
    std::lock_guard<std::mutex> lock(mutex);
    stopped = false;
  }
};

/// Worker loops run on `workers`; node calls run on `calls`, so a worker can give up on
/// a call that overruns its deadline. The call pool is twice as wide to leave room for
/// calls still finishing after their worker moved on.
struct TaskExecutorPool::Pools {
  exec::static_thread_pool workers;
  exec::static_thread_pool calls;

  explicit Pools(int count)
      : workers(static_cast<std::uint32_t>(std::max(count, 1))),
        calls(static_cast<std::uint32_t>(std::max(count, 1) * 2)) {}
};

/// State shared by a worker and the node call it handed to the call pool. A call the
/// worker stopped waiting for is abandoned: its result and log lines are dropped.
struct TaskExecutorPool::NodeCall {
  std::mutex mutex;
  std::condition_variable cv;
  std::optional<Expected<NodeResult>> result;
  bool abandoned = false;

  Json config;
  Json run_inputs;
  NodeInvocation invocation;
};

TaskExecutorPool::TaskExecutorPool(ExecutorConfig config, ExecutionStore& store, const NodeRegistry& registry,
                                   RunSupervisor& supervisor, RetryPolicy retry)
    : config_(config),
      store_(store),
      registry_(registry),
      supervisor_(supervisor),
      retry_(std::move(retry)),
      queue_(std::make_unique<WorkQueue>()) {
  if (config_.workers < 1) {
    config_.workers = 1;
  }
}

TaskExecutorPool::~TaskExecutorPool() { stop(); }

auto TaskExecutorPool::set_on_settled(std::function<void()> callback) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  on_settled_ = std::move(callback);
}

auto TaskExecutorPool::start() -> void {
  bool expected = false;
  if (!started_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  queue_->reopen();
  pools_ = std::make_unique<Pools>(config_.workers);
  alive_.store(config_.workers, std::memory_order_release);

  auto scheduler = pools_->workers.get_scheduler();
  for (int i = 0; i < config_.workers; ++i) {
    auto task = stdexec::schedule(scheduler) | stdexec::then([this]() { this->worker_loop(); });
    stdexec::start_detached(std::move(task));
  }
  im::log::info("task executor pool started with {} workers", config_.workers);
}

auto TaskExecutorPool::stop() -> void {
  if (!started_.load(std::memory_order_acquire) || stopping_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  queue_->stop();
  std::vector<CancellationToken> tokens;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [task_id, entry] : in_flight_) {
      tokens.push_back(entry.token);
    }
  }
  int count = alive_.load(std::memory_order_acquire);
  while (count != 0) {
    alive_.wait(count, std::memory_order_relaxed);
    count = alive_.load(std::memory_order_acquire);
  }
  // Workers left; nudge calls that are still running so the call pool can join.
  for (const auto& token : tokens) {
    token.cancel();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.clear();
  }
  idle_cv_.notify_all();
  pools_.reset();
  started_.store(false, std::memory_order_release);
  stopping_.store(false, std::memory_order_release);
  im::log::info("task executor pool stopped");
}

auto TaskExecutorPool::submit(const TaskExecution& task) -> bool {
  if (!started_.load(std::memory_order_acquire) || stopping_.load(std::memory_order_acquire)) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_.contains(task.id)) {
      return false;
    }
    in_flight_.emplace(task.id, InFlight{task.run_id, CancellationToken{}});
  }
  queue_->push(task);
  return true;
}

auto TaskExecutorPool::in_flight() const -> int {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(in_flight_.size());
}

auto TaskExecutorPool::is_in_flight(TaskId task_id) const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_flight_.contains(task_id);
}

auto TaskExecutorPool::wait_idle() -> void {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [&]() { return in_flight_.empty(); });
}

auto TaskExecutorPool::signal_cancel(RunId run_id) -> void {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [task_id, entry] : in_flight_) {
    if (entry.run_id == run_id) {
      entry.token.cancel();
    }
  }
}

auto TaskExecutorPool::worker_loop() -> void {
  TaskExecution task;
  while (queue_->pop(task)) {
    execute(task);
    finish(task.id);
  }
  if (alive_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
    alive_.notify_all();
  }
}

auto TaskExecutorPool::finish(TaskId task_id) -> void {
  std::function<void()> callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(task_id);
    callback = on_settled_;
  }
  idle_cv_.notify_all();
  if (callback) {
    callback();
  }
}

auto TaskExecutorPool::execute(const TaskExecution& queued) -> void {
  auto claimed = supervisor_.apply(queued.id, TaskTransition::claim());
  if (!claimed) {
    const auto& error = claimed.error();
    if (error.kind == ErrorKind::InvalidTransition || error.kind == ErrorKind::NotFound) {
      im::log::debug("claim lost for task {}: {}", queued.id, error.message);
    } else {
      im::log::warn("claim failed for task {}: {}", queued.id, error.message);
    }
    return;
  }
  const auto* current = find_updated(*claimed, queued.id);
  if (!current) {
    im::log::error("claim of task {} returned no task row", queued.id);
    return;
  }
  TaskExecution task = *current;

  CancellationToken base;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(task.id);
    if (it != in_flight_.end()) {
      base = it->second.token;
    }
  }
  supervisor_.log(task.run_id, task.id, task.attempt, LogLevel::Info, "system",
                  fmt::format("attempt {} of {} started ({})", task.attempt, task.max_retries + 1, task.node_type));
  im::log::debug("task {} ({}) attempt {} started", task.id, task.node_id, task.attempt);

  auto attempted = run_attempt(task, base);
  if (!attempted) {
    im::log::warn("pool stopping; task {} attempt {} left for recovery", task.id, task.attempt);
    return;
  }
  const auto& transition = *attempted;

  switch (transition.kind) {
    case TransitionKind::Succeed:
      supervisor_.log(task.run_id, task.id, task.attempt, LogLevel::Info, "system",
                      fmt::format("attempt {} succeeded (cost {:.4f}, tokens {})", task.attempt, transition.cost,
                                  transition.tokens_used));
      break;
    case TransitionKind::ScheduleRetry: {
      auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(*transition.retry_at - Clock::now());
      supervisor_.log(task.run_id, task.id, task.attempt, LogLevel::Warn, "system",
                      fmt::format("attempt {} failed: {}; retrying in {} ms", task.attempt, transition.error,
                                  std::max<std::int64_t>(delay.count(), 0)));
      break;
    }
    case TransitionKind::Fail:
      supervisor_.log(task.run_id, task.id, task.attempt, LogLevel::Error, "system",
                      fmt::format("attempt {} failed: {}", task.attempt, transition.error));
      break;
    case TransitionKind::Abandon:
      supervisor_.log(task.run_id, task.id, task.attempt, LogLevel::Warn, "system",
                      fmt::format("attempt {} discarded: run cancelled", task.attempt));
      break;
    default:
      break;
  }

  settle(task, transition);
}

auto TaskExecutorPool::run_attempt(const TaskExecution& task, const CancellationToken& base)
  -> std::optional<TaskTransition> {
  auto give_up_or_retry = [&](const EngineError& error) {
    auto decision = retry_.decide(task.attempt, task.max_retries, error.kind, task.retryable);
    if (const auto* retry = std::get_if<RetryAfter>(&decision)) {
      return TaskTransition::schedule_retry(task.attempt, Clock::now() + retry->delay, describe(error), error.kind);
    }
    return TaskTransition::fail(task.attempt, describe(error), error.kind);
  };

  if (base.is_cancelled()) {
    return TaskTransition::abandon(task.attempt);
  }

  const auto* entry = registry_.find(task.node_type);
  if (!entry || !entry->executor) {
    return give_up_or_retry(
      permanent_error(fmt::format("node type not registered: {}", task.node_type), "UNKNOWN_NODE_TYPE"));
  }

  auto call = std::make_shared<NodeCall>();
  call->config = task.config;
  Json inputs = Json::object();
  // A store outage is waited out here; it never counts against the task's retries.
  for (int store_attempt = 0;; ++store_attempt) {
    auto resolved = resolve_inputs(task, inputs, call->run_inputs);
    if (resolved) {
      break;
    }
    auto error = resolved.error();
    if (!is_retryable_store_error(error)) {
      if (error.kind != ErrorKind::PermanentTask) {
        error.kind = ErrorKind::TransientTask;
      }
      return give_up_or_retry(error);
    }
    if (stopping_.load(std::memory_order_acquire)) {
      return std::nullopt;
    }
    if (base.is_cancelled()) {
      return TaskTransition::abandon(task.attempt);
    }
    auto delay = store_backoff(store_attempt, config_.persist_backoff_base, config_.persist_backoff_max);
    im::log::warn("inputs of task {} unavailable ({}); retrying in {} ms", task.id, error.message, delay.count());
    std::this_thread::sleep_for(delay);
  }

  std::optional<TimePoint> deadline;
  if (task.timeout.count() > 0) {
    deadline = Clock::now() + task.timeout;
  }
  auto token = base.with_deadline(deadline);

  auto& invocation = call->invocation;
  invocation.run_id = task.run_id;
  invocation.task_id = task.id;
  invocation.node_id = task.node_id;
  invocation.node_type = task.node_type;
  invocation.attempt = task.attempt;
  invocation.config = &call->config;
  invocation.inputs = std::move(inputs);
  invocation.run_inputs = &call->run_inputs;
  invocation.log = [this, slot = std::weak_ptr<NodeCall>(call), run_id = task.run_id, task_id = task.id,
                    attempt = task.attempt](LogLevel level, std::string message) {
    auto owner = slot.lock();
    if (!owner) {
      return;
    }
    std::lock_guard<std::mutex> lock(owner->mutex);
    if (!owner->abandoned) {
      supervisor_.log(run_id, task_id, attempt, level, "node", std::move(message));
    }
  };

  auto executor = entry->executor;
  auto sender = stdexec::schedule(pools_->calls.get_scheduler()) | stdexec::then([call, executor, token]() {
                  Expected<NodeResult> result = tl::unexpected(permanent_error("node did not run"));
                  try {
                    result = executor->execute(call->invocation, token);
                  } catch (const std::exception& ex) {
                    result = tl::unexpected(
                      permanent_error(fmt::format("node raised: {}", ex.what()), "NODE_EXCEPTION"));
                  }
                  {
                    std::lock_guard<std::mutex> lock(call->mutex);
                    call->result = std::move(result);
                  }
                  call->cv.notify_all();
                });
  stdexec::start_detached(std::move(sender));

  bool returned = await_call(*call, token);

  if (token.is_cancelled()) {
    return TaskTransition::abandon(task.attempt);
  }
  if (!returned && stopping_.load(std::memory_order_acquire) && !token.deadline_exceeded()) {
    return std::nullopt;
  }
  if (!returned || token.deadline_exceeded()) {
    return give_up_or_retry(
      make_error(ErrorKind::Timeout, fmt::format("task timed out after {} ms", task.timeout.count()), "TIMEOUT"));
  }
  auto result = std::move(*call->result);
  if (result) {
    return TaskTransition::succeed(task.attempt, std::move(result->outputs), result->cost, result->tokens_used);
  }
  return give_up_or_retry(result.error());
}

/// Waits for the node call to return. Gives up, marking the call abandoned, once the
/// task's deadline passes, the run is cancelled, or the pool is stopping.
auto TaskExecutorPool::await_call(NodeCall& call, const CancellationToken& token) -> bool {
  constexpr auto kSlice = std::chrono::milliseconds(10);
  std::unique_lock<std::mutex> lock(call.mutex);
  while (!call.result) {
    if (token.should_stop() || stopping_.load(std::memory_order_acquire)) {
      call.abandoned = true;
      return false;
    }
    auto wait = kSlice;
    if (auto deadline = token.deadline()) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()) +
                  std::chrono::milliseconds(1);
      wait = std::clamp(left, std::chrono::milliseconds(1), kSlice);
    }
    call.cv.wait_for(lock, wait);
  }
  return true;
}

auto TaskExecutorPool::resolve_inputs(const TaskExecution& task, Json& inputs, Json& run_inputs) -> Expected<void> {
  auto run = store_.load_run(task.run_id);
  if (!run) {
    return tl::unexpected(run.error());
  }
  run_inputs = run->inputs;
  if (task.inputs.empty()) {
    return {};
  }

  auto tasks = store_.load_tasks(task.run_id);
  if (!tasks) {
    return tl::unexpected(tasks.error());
  }
  std::unordered_map<TaskId, const TaskExecution*> by_id;
  for (const auto& upstream : *tasks) {
    by_id.emplace(upstream.id, &upstream);
  }

  for (const auto& binding : task.inputs) {
    auto it = by_id.find(binding.source_task);
    if (it == by_id.end() || it->second->status != TaskStatus::Succeeded) {
      // Optional upstream nodes that were skipped leave their inputs unset.
      continue;
    }
    const auto& output = it->second->output;
    if (binding.source_handle.empty()) {
      inputs[binding.target_handle] = output;
    } else if (output.is_object() && output.contains(binding.source_handle)) {
      inputs[binding.target_handle] = output.at(binding.source_handle);
    }
  }
  return {};
}

auto TaskExecutorPool::settle(const TaskExecution& task, const TaskTransition& transition) -> void {
  for (int attempt = 0;; ++attempt) {
    auto result = supervisor_.apply(task.id, transition);
    if (result) {
      return;
    }
    const auto& error = result.error();
    if (error.kind == ErrorKind::InvalidTransition || error.kind == ErrorKind::NotFound) {
      im::log::debug("result of task {} attempt {} dropped: {}", task.id, task.attempt, error.message);
      return;
    }
    if (!is_retryable_store_error(error)) {
      im::log::error("result of task {} attempt {} rejected: {}", task.id, task.attempt, error.message);
      return;
    }
    if (stopping_.load(std::memory_order_acquire)) {
      im::log::warn("store unavailable while stopping; task {} will be recovered on restart", task.id);
      return;
    }
    auto delay = std::min(store_backoff(attempt, config_.persist_backoff_base, config_.persist_backoff_max),
                          config_.persist_backoff_max);
    im::log::warn("persisting task {} failed ({}); retrying in {} ms", task.id, error.message, delay.count());
    std::this_thread::sleep_for(delay);
  }
}

}  // namespace im::engine
