#include "engine/types.hpp"

#include <array>
#include <utility>

namespace im::engine {
namespace {

template <typename Enum, std::size_t N>
auto parse_enum(std::string_view text, const std::array<std::pair<std::string_view, Enum>, N>& table,
                std::string_view label) -> Expected<Enum> {
  for (const auto& [name, value] : table) {
    if (name == text) {
      return value;
    }
  }
  return tl::unexpected(make_error(ErrorKind::Validation, std::string("unknown ") + std::string(label) + ": " +
                                                              std::string(text)));
}

constexpr std::array<std::pair<std::string_view, RunStatus>, 5> kRunStatuses{{
  {"QUEUED", RunStatus::Queued},
  {"RUNNING", RunStatus::Running},
  {"COMPLETED", RunStatus::Completed},
  {"FAILED", RunStatus::Failed},
  {"CANCELLED", RunStatus::Cancelled},
}};

constexpr std::array<std::pair<std::string_view, TaskStatus>, 7> kTaskStatuses{{
  {"PENDING", TaskStatus::Pending},
  {"READY", TaskStatus::Ready},
  {"RUNNING", TaskStatus::Running},
  {"SUCCEEDED", TaskStatus::Succeeded},
  {"FAILED", TaskStatus::Failed},
  {"RETRYING", TaskStatus::Retrying},
  {"SKIPPED", TaskStatus::Skipped},
}};

constexpr std::array<std::pair<std::string_view, LogLevel>, 4> kLogLevels{{
  {"DEBUG", LogLevel::Debug},
  {"INFO", LogLevel::Info},
  {"WARN", LogLevel::Warn},
  {"ERROR", LogLevel::Error},
}};

constexpr std::array<std::pair<std::string_view, ErrorKind>, 8> kErrorKinds{{
  {"validation", ErrorKind::Validation},
  {"claim_conflict", ErrorKind::ClaimConflict},
  {"transient", ErrorKind::TransientTask},
  {"permanent", ErrorKind::PermanentTask},
  {"timeout", ErrorKind::Timeout},
  {"store_unavailable", ErrorKind::StoreUnavailable},
  {"not_found", ErrorKind::NotFound},
  {"invalid_transition", ErrorKind::InvalidTransition},
}};

template <typename Enum, std::size_t N>
auto enum_name(Enum value, const std::array<std::pair<std::string_view, Enum>, N>& table) -> std::string_view {
  for (const auto& [name, entry] : table) {
    if (entry == value) {
      return name;
    }
  }
  return "UNKNOWN";
}

auto optional_millis(const std::optional<TimePoint>& tp) -> Json {
  if (!tp) {
    return nullptr;
  }
  return to_millis(*tp);
}

}  // namespace

auto to_string(ErrorKind kind) -> std::string_view { return enum_name(kind, kErrorKinds); }
auto to_string(RunStatus status) -> std::string_view { return enum_name(status, kRunStatuses); }
auto to_string(TaskStatus status) -> std::string_view { return enum_name(status, kTaskStatuses); }
auto to_string(LogLevel level) -> std::string_view { return enum_name(level, kLogLevels); }

auto parse_run_status(std::string_view text) -> Expected<RunStatus> {
  return parse_enum(text, kRunStatuses, "run status");
}

auto parse_task_status(std::string_view text) -> Expected<TaskStatus> {
  return parse_enum(text, kTaskStatuses, "task status");
}

auto parse_log_level(std::string_view text) -> Expected<LogLevel> {
  return parse_enum(text, kLogLevels, "log level");
}

auto parse_error_kind(std::string_view text) -> Expected<ErrorKind> {
  return parse_enum(text, kErrorKinds, "error kind");
}

auto to_json(const Run& run) -> Json {
  Json json = Json::object();
  json["id"] = run.id;
  json["pipelineId"] = run.pipeline_id;
  json["userId"] = run.user_id;
  json["status"] = to_string(run.status);
  json["priority"] = run.priority;
  json["queuedAt"] = to_millis(run.queued_at);
  json["scheduledFor"] = optional_millis(run.scheduled_for);
  json["startedAt"] = optional_millis(run.started_at);
  json["completedAt"] = optional_millis(run.completed_at);
  json["deadline"] = optional_millis(run.deadline);
  json["progress"] = run.progress;
  json["totalTasks"] = run.total_tasks;
  json["completedTasks"] = run.completed_tasks;
  json["retryCount"] = run.retry_count;
  json["totalCost"] = run.total_cost;
  json["tokensUsed"] = run.tokens_used;
  json["durationMs"] = run.duration_ms;
  json["cancelRequested"] = run.cancel_requested;
  if (!run.error.empty()) {
    json["error"] = run.error;
  }
  return json;
}

auto to_json(const TaskExecution& task) -> Json {
  Json json = Json::object();
  json["id"] = task.id;
  json["runId"] = task.run_id;
  json["nodeId"] = task.node_id;
  json["nodeType"] = task.node_type;
  json["executionOrder"] = task.execution_order;
  json["dependsOn"] = task.depends_on;
  json["status"] = to_string(task.status);
  json["attempt"] = task.attempt;
  json["startedAt"] = optional_millis(task.started_at);
  json["finishedAt"] = optional_millis(task.finished_at);
  json["retryAt"] = optional_millis(task.retry_at);
  if (!task.error.empty()) {
    json["error"] = task.error;
  }
  if (task.error_kind) {
    json["errorKind"] = to_string(*task.error_kind);
  }
  json["output"] = task.output;
  json["cost"] = task.cost;
  json["tokensUsed"] = task.tokens_used;
  return json;
}

auto to_json(const LogEntry& entry) -> Json {
  Json json = Json::object();
  json["id"] = entry.id;
  json["runId"] = entry.run_id;
  json["taskId"] = entry.task_id ? Json(*entry.task_id) : Json(nullptr);
  json["attempt"] = entry.attempt;
  json["level"] = to_string(entry.level);
  json["category"] = entry.category;
  json["message"] = entry.message;
  json["at"] = to_millis(entry.at);
  return json;
}

}  // namespace im::engine
