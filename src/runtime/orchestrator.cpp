#include "runtime/orchestrator.hpp"

#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <sstream>
#include <unordered_map>

#include <gflags/gflags.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include "common/logging/log.hpp"
#include "engine/memory_store.hpp"
#include "engine/sqlite_store.hpp"

DECLARE_int32(max_concurrent_tasks);
DECLARE_int32(dispatch_poll_ms);
DECLARE_int32(admission_batch);
DECLARE_int32(max_retries);
DECLARE_int32(retry_base_ms);
DECLARE_int32(retry_max_ms);
DECLARE_int32(task_timeout_ms);
DECLARE_string(store_path);

namespace im::engine {

/// Wakes wait_for() callers when their run reaches a terminal status. Only runs with a
/// waiter are tracked, and a run is forgotten when its last waiter leaves.
class Orchestrator::TerminalWatcher final : public EventSink {
 public:
  auto publish(RunId run_id, const Event& event) -> void override {
    if (event.type != EventType::RunCompleted && event.type != EventType::RunFailed &&
        event.type != EventType::RunCancelled) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = waiters_.find(run_id);
      if (it == waiters_.end()) {
        return;
      }
      it->second.finished = true;
    }
    cv_.notify_all();
  }

  auto watch(RunId run_id) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    waiters_[run_id].count += 1;
  }

  auto unwatch(RunId run_id) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = waiters_.find(run_id);
    if (it != waiters_.end() && --it->second.count == 0) {
      waiters_.erase(it);
    }
  }

  /// True once the run is known to be finished; otherwise waits up to `slice`.
  auto wait(RunId run_id, std::chrono::milliseconds slice) -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, slice, [&]() {
      auto it = waiters_.find(run_id);
      return it != waiters_.end() && it->second.finished;
    });
  }

  auto tracked() -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
  }

 private:
  struct Waiters {
    int count = 0;
    bool finished = false;
  };

  std::mutex mutex_;
  std::condition_variable cv_;
  std::unordered_map<RunId, Waiters> waiters_;
};

auto OrchestratorConfig::from_flags() -> OrchestratorConfig {
  OrchestratorConfig config;
  config.max_concurrent_tasks = std::max(FLAGS_max_concurrent_tasks, 1);
  config.dispatch_poll_interval = std::chrono::milliseconds(std::max(FLAGS_dispatch_poll_ms, 1));
  config.admission_batch = static_cast<std::size_t>(std::max(FLAGS_admission_batch, 1));
  config.retry.max_retries = std::max(FLAGS_max_retries, 0);
  config.retry.base = std::chrono::milliseconds(std::max(FLAGS_retry_base_ms, 0));
  config.retry.max_delay = std::chrono::milliseconds(std::max(FLAGS_retry_max_ms, 0));
  config.default_task_timeout = std::chrono::milliseconds(std::max(FLAGS_task_timeout_ms, 0));
  config.store_path = FLAGS_store_path;
  return config;
}

auto to_json(const RunView& view) -> Json {
  Json tasks = Json::array();
  for (const auto& task : view.tasks) {
    tasks.push_back(to_json(task));
  }
  return Json{{"run", to_json(view.run)}, {"tasks", std::move(tasks)}};
}

Orchestrator::Orchestrator(OrchestratorConfig config, std::shared_ptr<ExecutionStore> store)
    : config_(std::move(config)), store_(std::move(store)), watcher_(std::make_shared<TerminalWatcher>()) {
  im::log::init();
  im::log::info("Initializing orchestrator");

  SupervisorConfig supervisor_config;
  supervisor_config.compile.default_max_retries = config_.retry.max_retries;
  supervisor_config.compile.default_timeout = config_.default_task_timeout;
  supervisor_ = std::make_unique<RunSupervisor>(*store_, registry_, events_, supervisor_config);

  ExecutorConfig executor_config;
  executor_config.workers = config_.max_concurrent_tasks;
  pool_ = std::make_unique<TaskExecutorPool>(executor_config, *store_, registry_, *supervisor_,
                                             RetryPolicy(config_.retry));

  DispatcherConfig dispatcher_config;
  dispatcher_config.max_concurrent_tasks = config_.max_concurrent_tasks;
  dispatcher_config.poll_interval = config_.dispatch_poll_interval;
  dispatcher_config.admission_batch = config_.admission_batch;
  dispatcher_ = std::make_unique<Dispatcher>(dispatcher_config, *store_, *pool_, *supervisor_);

  events_.add_sink(watcher_);
  events_.add_sink(std::make_shared<LoggingEventSink>());
  pool_->set_on_settled([this]() { dispatcher_->wake(); });
}

Orchestrator::~Orchestrator() { stop(); }

auto Orchestrator::create(OrchestratorConfig config) -> Expected<std::unique_ptr<Orchestrator>> {
  std::shared_ptr<ExecutionStore> store;
  if (config.store_path.empty()) {
    store = std::make_shared<MemoryExecutionStore>();
  } else {
    SqliteStoreOptions options;
    options.path = config.store_path;
    auto opened = SqliteExecutionStore::open(options);
    if (!opened) {
      return tl::unexpected(opened.error());
    }
    store = std::move(*opened);
  }
  return std::make_unique<Orchestrator>(std::move(config), std::move(store));
}

auto Orchestrator::registry() -> NodeRegistry& { return registry_; }

auto Orchestrator::registry() const -> const NodeRegistry& { return registry_; }

auto Orchestrator::events() -> EventPublisher& { return events_; }

auto Orchestrator::store() -> ExecutionStore& { return *store_; }

auto Orchestrator::start() -> Expected<void> {
  if (started_) {
    return {};
  }
  if (config_.recover_on_start) {
    if (auto recovered = supervisor_->recover(Clock::now()); !recovered) {
      return tl::unexpected(recovered.error());
    }
  }
  pool_->start();
  dispatcher_->start();
  started_ = true;
  im::log::info("orchestrator started with node types: {}", fmt::join(registry_.types(), ", "));
  return {};
}

auto Orchestrator::stop() -> void {
  if (!started_) {
    return;
  }
  dispatcher_->stop();
  pool_->stop();
  started_ = false;
  im::log::info("orchestrator stopped");
}

auto Orchestrator::submit(const PipelineDefinition& pipeline, const SubmitOptions& options) -> Expected<RunId> {
  RunRequest request;
  request.pipeline_id = options.pipeline_id.empty() ? pipeline.id : options.pipeline_id;
  request.user_id = options.user_id;
  request.priority = options.priority;
  request.inputs = options.inputs.is_null() ? Json::object() : options.inputs;
  request.scheduled_for = options.scheduled_for;
  request.max_retries = options.max_retries;
  if (options.timeout) {
    request.deadline = options.scheduled_for.value_or(Clock::now()) + *options.timeout;
  }

  auto run = supervisor_->submit(pipeline, request);
  if (!run) {
    return tl::unexpected(run.error());
  }
  dispatcher_->wake();
  return run->id;
}

auto Orchestrator::submit_json(const Json& json, const SubmitOptions& options) -> Expected<RunId> {
  auto pipeline = parse_pipeline_json(json);
  if (!pipeline) {
    return tl::unexpected(pipeline.error());
  }
  return submit(*pipeline, options);
}

auto Orchestrator::submit_file(std::string_view path, const SubmitOptions& options) -> Expected<RunId> {
  std::ifstream file{std::string(path)};
  if (!file) {
    return tl::unexpected(
      make_error(ErrorKind::NotFound, fmt::format("failed to open pipeline file: {}", path), "PIPELINE_FILE"));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  auto pipeline = parse_pipeline_text(buffer.str());
  if (!pipeline) {
    return tl::unexpected(pipeline.error());
  }
  return submit(*pipeline, options);
}

auto Orchestrator::cancel(RunId run_id, std::string reason) -> Expected<void> {
  auto result = supervisor_->cancel(run_id, std::move(reason));
  if (!result) {
    return tl::unexpected(result.error());
  }
  pool_->signal_cancel(run_id);
  dispatcher_->wake();
  return {};
}

auto Orchestrator::status(RunId run_id) -> Expected<RunView> {
  auto run = store_->load_run(run_id);
  if (!run) {
    return tl::unexpected(run.error());
  }
  auto tasks = store_->load_tasks(run_id);
  if (!tasks) {
    return tl::unexpected(tasks.error());
  }
  return RunView{std::move(*run), std::move(*tasks)};
}

auto Orchestrator::logs(RunId run_id, std::optional<TaskId> task_id) -> Expected<std::vector<LogEntry>> {
  return store_->list_logs(run_id, task_id);
}

auto Orchestrator::purge(RunId run_id) -> Expected<void> {
  return store_->purge_run(run_id);
}

auto Orchestrator::wait_for(RunId run_id, std::chrono::milliseconds timeout) -> Expected<Run> {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  watcher_->watch(run_id);
  struct Unwatch {
    TerminalWatcher& watcher;
    RunId run_id;
    ~Unwatch() { watcher.unwatch(run_id); }
  } unwatch{*watcher_, run_id};
  while (true) {
    auto run = store_->load_run(run_id);
    if (!run) {
      return tl::unexpected(run.error());
    }
    if (is_terminal(run->status)) {
      return run;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return tl::unexpected(make_error(ErrorKind::Timeout,
                                       fmt::format("run {} still {} after {} ms", run_id, to_string(run->status),
                                                   timeout.count()),
                                       "WAIT_TIMEOUT"));
    }
    auto slice = std::min(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now),
                          std::chrono::milliseconds(50));
    watcher_->wait(run_id, slice);
  }
}

auto Orchestrator::health() const -> DispatcherHealth {
  return dispatcher_->health();
}

auto Orchestrator::waiting_runs() const -> std::size_t {
  return watcher_->tracked();
}

}  // namespace im::engine
