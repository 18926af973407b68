#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/error.hpp"

namespace im::engine {

using Json = nlohmann::json;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using RunId = std::int64_t;
using TaskId = std::int64_t;
using LogId = std::int64_t;

enum class RunStatus {
  Queued,
  Running,
  Completed,
  Failed,
  Cancelled,
};

enum class TaskStatus {
  Pending,
  Ready,
  Running,
  Succeeded,
  Failed,
  Retrying,
  Skipped,
};

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
};

auto to_string(RunStatus status) -> std::string_view;
auto to_string(TaskStatus status) -> std::string_view;
auto to_string(LogLevel level) -> std::string_view;
auto parse_run_status(std::string_view text) -> Expected<RunStatus>;
auto parse_task_status(std::string_view text) -> Expected<TaskStatus>;
auto parse_log_level(std::string_view text) -> Expected<LogLevel>;
auto parse_error_kind(std::string_view text) -> Expected<ErrorKind>;

inline auto is_terminal(RunStatus status) -> bool {
  return status == RunStatus::Completed || status == RunStatus::Failed || status == RunStatus::Cancelled;
}

inline auto is_terminal(TaskStatus status) -> bool {
  return status == TaskStatus::Succeeded || status == TaskStatus::Failed || status == TaskStatus::Skipped;
}

/// Milliseconds since the epoch; the unit timestamps are persisted and serialized in.
inline auto to_millis(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline auto from_millis(std::int64_t ms) -> TimePoint {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

/// Routes one dependency output into a task input. An empty source handle forwards the
/// whole output object.
struct InputBinding {
  std::string target_handle;
  TaskId source_task = 0;
  std::string source_handle;
};

struct Run {
  RunId id = 0;
  std::string pipeline_id;
  std::string user_id;
  RunStatus status = RunStatus::Queued;
  int priority = 0;
  TimePoint queued_at{};
  std::optional<TimePoint> scheduled_for;
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> completed_at;
  std::optional<TimePoint> deadline;
  double progress = 0.0;
  int total_tasks = 0;
  int completed_tasks = 0;
  int retry_count = 0;
  double total_cost = 0.0;
  std::int64_t tokens_used = 0;
  std::int64_t duration_ms = 0;
  bool cancel_requested = false;
  std::string cancel_reason;
  std::string error;
  Json inputs = Json::object();
  std::uint64_t last_event_sequence = 0;
};

struct TaskExecution {
  TaskId id = 0;
  RunId run_id = 0;
  std::string node_id;
  std::string node_type;
  int execution_order = 0;
  std::vector<TaskId> depends_on;
  std::vector<InputBinding> inputs;
  Json config = Json::object();
  TaskStatus status = TaskStatus::Pending;
  int attempt = 0;
  int max_retries = 0;
  /// False for optional node types: their failures never fail the run.
  bool critical = true;
  /// False when timeouts of this node type must not be retried.
  bool retryable = true;
  std::chrono::milliseconds timeout{0};
  std::optional<TimePoint> started_at;
  std::optional<TimePoint> finished_at;
  std::optional<TimePoint> retry_at;
  std::string error;
  std::optional<ErrorKind> error_kind;
  Json output;
  double cost = 0.0;
  std::int64_t tokens_used = 0;
};

struct LogEntry {
  LogId id = 0;
  RunId run_id = 0;
  std::optional<TaskId> task_id;
  int attempt = 0;
  LogLevel level = LogLevel::Info;
  std::string category = "system";
  std::string message;
  TimePoint at{};
};

auto to_json(const Run& run) -> Json;
auto to_json(const TaskExecution& task) -> Json;
auto to_json(const LogEntry& entry) -> Json;

}  // namespace im::engine
