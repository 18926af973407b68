#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string_view>

#include "engine/store.hpp"
#include "runtime/executor.hpp"
#include "runtime/supervisor.hpp"

namespace im::engine {

enum class DispatcherHealth {
  Healthy,
  /// The store was unreachable on the last cycle; admission is suspended.
  Degraded,
};

auto to_string(DispatcherHealth health) -> std::string_view;

struct DispatcherConfig {
  int max_concurrent_tasks = 4;
  std::chrono::milliseconds poll_interval{100};
  /// Eligible runs fetched per store query; a cycle pages on while capacity remains.
  std::size_t admission_batch = 16;
};

struct CycleReport {
  int dispatched = 0;
  int requeued = 0;
  int deadlines_enforced = 0;
  DispatcherHealth health = DispatcherHealth::Healthy;
};

/// Moves READY work to the executor pool in run-priority order. Runs a cycle every
/// poll interval and whenever wake() is called.
class Dispatcher {
 public:
  Dispatcher(DispatcherConfig config, ExecutionStore& store, TaskExecutorPool& pool, RunSupervisor& supervisor);
  ~Dispatcher();

  Dispatcher(const Dispatcher&) = delete;
  auto operator=(const Dispatcher&) -> Dispatcher& = delete;

  auto start() -> void;
  auto stop() -> void;
  /// Request an immediate cycle. Concurrent requests coalesce into one.
  auto wake() -> void;

  /// One dispatch pass; also used directly by tests.
  auto run_cycle() -> CycleReport;

  auto health() const -> DispatcherHealth { return health_.load(std::memory_order_acquire); }

 private:
  class Loop;

  auto set_health(DispatcherHealth health) -> void;

  DispatcherConfig config_;
  ExecutionStore& store_;
  TaskExecutorPool& pool_;
  RunSupervisor& supervisor_;
  std::atomic<DispatcherHealth> health_{DispatcherHealth::Healthy};
  std::mutex cycle_mutex_;
  std::mutex loop_mutex_;
  std::unique_ptr<Loop> loop_;
};

}  // namespace im::engine
