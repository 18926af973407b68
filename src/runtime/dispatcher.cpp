#include "runtime/dispatcher.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include <exec/async_scope.hpp>
#include <exec/timed_thread_scheduler.hpp>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace im::engine {

auto to_string(DispatcherHealth health) -> std::string_view {
  switch (health) {
    case DispatcherHealth::Healthy:
      return "HEALTHY";
    case DispatcherHealth::Degraded:
      return "DEGRADED";
  }
  return "UNKNOWN";
}

/// Timer-driven cycle loop on its own timed thread. Every cycle runs on that thread, so
/// polled and woken cycles never overlap.
class Dispatcher::Loop {
 public:
  Loop(Dispatcher& dispatcher, std::chrono::milliseconds poll_interval)
      : dispatcher_(dispatcher),
        poll_interval_(poll_interval),
        scheduler_context_(std::make_unique<exec::timed_thread_context>()),
        scheduler_(scheduler_context_->get_scheduler()),
        scope_() {
    schedule_poll();
  }

  ~Loop() {
    running_ = false;
    stdexec::sync_wait(scope_.on_empty());
  }

  auto wake() -> void {
    if (!running_.load(std::memory_order_relaxed) || wake_pending_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    auto sender = exec::schedule_after(scheduler_, std::chrono::milliseconds(0)) | stdexec::then([this] {
                    wake_pending_.store(false, std::memory_order_release);
                    if (running_.load(std::memory_order_relaxed)) {
                      dispatcher_.run_cycle();
                    }
                  });
    scope_.spawn(std::move(sender));
  }

 private:
  auto schedule_poll() -> void {
    if (!running_.load(std::memory_order_relaxed)) {
      return;
    }
    auto sender = exec::schedule_after(scheduler_, poll_interval_) | stdexec::then([this] {
                    if (running_.load(std::memory_order_relaxed)) {
                      dispatcher_.run_cycle();
                      schedule_poll();
                    }
                  });
    scope_.spawn(std::move(sender));
  }

  Dispatcher& dispatcher_;
  std::chrono::milliseconds poll_interval_;
  std::unique_ptr<exec::timed_thread_context> scheduler_context_;
  exec::timed_thread_scheduler scheduler_;
  std::atomic<bool> running_{true};
  std::atomic<bool> wake_pending_{false};
  exec::async_scope scope_;
};

Dispatcher::Dispatcher(DispatcherConfig config, ExecutionStore& store, TaskExecutorPool& pool,
                       RunSupervisor& supervisor)
    : config_(config), store_(store), pool_(pool), supervisor_(supervisor) {
  if (config_.max_concurrent_tasks < 1) {
    config_.max_concurrent_tasks = 1;
  }
}

Dispatcher::~Dispatcher() { stop(); }

auto Dispatcher::start() -> void {
  std::lock_guard<std::mutex> lock(loop_mutex_);
  if (loop_) {
    return;
  }
  loop_ = std::make_unique<Loop>(*this, config_.poll_interval);
  im::log::info("dispatcher started: max_concurrent_tasks={} poll_interval={}ms", config_.max_concurrent_tasks,
                config_.poll_interval.count());
  loop_->wake();
}

auto Dispatcher::stop() -> void {
  std::unique_ptr<Loop> loop;
  {
    std::lock_guard<std::mutex> lock(loop_mutex_);
    loop = std::move(loop_);
  }
  if (!loop) {
    return;
  }
  loop.reset();
  im::log::info("dispatcher stopped");
}

auto Dispatcher::wake() -> void {
  std::lock_guard<std::mutex> lock(loop_mutex_);
  if (loop_) {
    loop_->wake();
  }
}

auto Dispatcher::set_health(DispatcherHealth health) -> void {
  auto previous = health_.exchange(health, std::memory_order_acq_rel);
  if (previous == health) {
    return;
  }
  if (health == DispatcherHealth::Degraded) {
    im::log::warn("dispatcher health DEGRADED: execution store unavailable, admission suspended");
  } else {
    im::log::info("dispatcher health HEALTHY: admission resumed");
  }
}

auto Dispatcher::run_cycle() -> CycleReport {
  std::lock_guard<std::mutex> lock(cycle_mutex_);
  CycleReport report;
  const auto now = Clock::now();

  auto degraded = [&](const EngineError& error) {
    im::log::debug("dispatch cycle aborted: {}", error.message);
    set_health(DispatcherHealth::Degraded);
    report.health = DispatcherHealth::Degraded;
    return report;
  };

  auto expired = supervisor_.enforce_deadlines(now);
  if (!expired) {
    return degraded(expired.error());
  }
  for (RunId run_id : *expired) {
    pool_.signal_cancel(run_id);
    report.deadlines_enforced += 1;
  }

  int capacity = config_.max_concurrent_tasks - pool_.in_flight();
  if (capacity <= 0) {
    set_health(DispatcherHealth::Healthy);
    return report;
  }

  // Page through eligible runs until capacity is used up, so runs waiting on backoff
  // or on in-flight dependencies never hide lower-priority READY work. Runs finalized
  // mid-cycle shift later pages; anything skipped is picked up next cycle.
  std::size_t offset = 0;
  while (capacity > 0) {
    auto runs = store_.list_eligible_runs(config_.admission_batch, now, offset);
    if (!runs) {
      return degraded(runs.error());
    }

    for (const auto& run : *runs) {
      if (capacity <= 0) {
        break;
      }
      auto tasks = store_.load_tasks(run.id);
      if (!tasks) {
        if (tasks.error().kind == ErrorKind::StoreUnavailable) {
          return degraded(tasks.error());
        }
        continue;
      }

      bool active = false;
      for (auto& task : *tasks) {
        if (!is_terminal(task.status)) {
          active = true;
        }
        if (task.status != TaskStatus::Retrying || (task.retry_at && *task.retry_at > now)) {
          continue;
        }
        auto requeued = supervisor_.apply(task.id, TaskTransition::requeue());
        if (!requeued) {
          if (requeued.error().kind == ErrorKind::StoreUnavailable) {
            return degraded(requeued.error());
          }
          continue;
        }
        task.status = TaskStatus::Ready;
        report.requeued += 1;
      }

      if (!active) {
        if (auto reconciled = supervisor_.reconcile(run.id); !reconciled) {
          im::log::warn("reconcile of run {} failed: {}", run.id, reconciled.error().message);
        }
        continue;
      }

      // Tasks arrive sorted by execution_order.
      for (const auto& task : *tasks) {
        if (capacity <= 0) {
          break;
        }
        if (task.status != TaskStatus::Ready || pool_.is_in_flight(task.id)) {
          continue;
        }
        if (pool_.submit(task)) {
          capacity -= 1;
          report.dispatched += 1;
        }
      }
    }

    if (config_.admission_batch == 0 || runs->size() < config_.admission_batch) {
      break;
    }
    offset += runs->size();
  }

  set_health(DispatcherHealth::Healthy);
  if (report.dispatched > 0 || report.requeued > 0) {
    im::log::debug("dispatch cycle: dispatched={} requeued={}", report.dispatched, report.requeued);
  }
  return report;
}

}  // namespace im::engine
