#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace im::engine {

/// Cooperative cancellation handle passed to node executors. Cancellation is requested
/// by the orchestrator when a run is cancelled; the deadline is the per-task timeout.
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
  explicit CancellationToken(std::optional<Clock::time_point> deadline)
      : flag_(std::make_shared<std::atomic<bool>>(false)), deadline_(deadline) {}

  auto cancel() const -> void { flag_->store(true, std::memory_order_release); }

  auto is_cancelled() const -> bool { return flag_->load(std::memory_order_acquire); }

  auto deadline() const -> std::optional<Clock::time_point> { return deadline_; }

  /// A token sharing this one's cancellation flag, with its own deadline.
  auto with_deadline(std::optional<Clock::time_point> deadline) const -> CancellationToken {
    CancellationToken token = *this;
    token.deadline_ = deadline;
    return token;
  }

  auto deadline_exceeded() const -> bool { return deadline_ && Clock::now() > *deadline_; }

  /// True when the executor should stop working on the current call.
  auto should_stop() const -> bool { return is_cancelled() || deadline_exceeded(); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
  std::optional<Clock::time_point> deadline_;
};

using NodeLogFn = std::function<void(LogLevel, std::string)>;

struct NodeInvocation {
  RunId run_id = 0;
  TaskId task_id = 0;
  std::string node_id;
  std::string node_type;
  int attempt = 0;
  const Json* config = nullptr;
  /// Input handle -> value, resolved from dependency outputs.
  Json inputs = Json::object();
  /// Inputs supplied with the run submission.
  const Json* run_inputs = nullptr;
  /// Appends an attempt-scoped entry to the execution log.
  NodeLogFn log;
};

struct NodeResult {
  Json outputs = Json::object();
  double cost = 0.0;
  std::int64_t tokens_used = 0;
};

/// Node execution collaborator. Implementations report failures with
/// ErrorKind::TransientTask (network, timeout, rate limit) or ErrorKind::PermanentTask.
class NodeExecutor {
 public:
  virtual ~NodeExecutor() = default;

  virtual auto execute(const NodeInvocation& invocation, const CancellationToken& token)
    -> Expected<NodeResult> = 0;
};

inline auto transient_error(std::string message, std::string code = "TEMPORARY_FAILURE") -> EngineError {
  return make_error(ErrorKind::TransientTask, std::move(message), std::move(code));
}

inline auto permanent_error(std::string message, std::string code = "EXECUTION_ERROR") -> EngineError {
  return make_error(ErrorKind::PermanentTask, std::move(message), std::move(code));
}

}  // namespace im::engine
